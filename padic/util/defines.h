#pragma once

// Bound on the degree of parsed polynomials
#define PADIC_POLY_DEGREE_MAX 65536

// GNU GCC/G++ and Clang
#if defined(__GNUC__) && defined(__cplusplus)

#ifdef __SIZEOF_INT128__
#define PADIC_ENABLE___INT128
#endif

#define PADIC_MSB_INDEX_UINT64(result, value) {                                     \
    *result = 63 - __builtin_clzll(value);                                          \
}

#ifdef PADIC_ENABLE___INT128
#define PADIC_MULTIPLY_UINT64_HW64(operand1, operand2, hw64) {                      \
    *hw64 = static_cast<std::uint64_t>((static_cast<unsigned __int128>(operand1)    \
            * static_cast<unsigned __int128>(operand2)) >> 64);                     \
}
#define PADIC_MULTIPLY_UINT64(operand1, operand2, result128) {                      \
    unsigned __int128 product = static_cast<unsigned __int128>(operand1) * operand2;\
    result128[0] = static_cast<std::uint64_t>(product);                             \
    result128[1] = static_cast<std::uint64_t>(product >> 64);                       \
}
#define PADIC_DIVIDE_UINT128_UINT64(numerator, denominator, quotient) {             \
    unsigned __int128 n = (static_cast<unsigned __int128>(numerator[1]) << 64)      \
            | numerator[0];                                                         \
    unsigned __int128 q = n / (denominator);                                        \
    numerator[0] = static_cast<std::uint64_t>(n - q * (denominator));               \
    numerator[1] = 0;                                                               \
    quotient[0] = static_cast<std::uint64_t>(q);                                    \
    quotient[1] = static_cast<std::uint64_t>(q >> 64);                              \
}
#endif //PADIC_ENABLE___INT128

#endif //__GNUC__

// Use generic functions as (slower) fallback
#ifndef PADIC_MULTIPLY_UINT64
#define PADIC_MULTIPLY_UINT64(operand1, operand2, result128) {                      \
    multiply_uint64_generic(operand1, operand2, result128);                         \
}
#endif

#ifndef PADIC_MULTIPLY_UINT64_HW64
#define PADIC_MULTIPLY_UINT64_HW64(operand1, operand2, hw64) {                      \
    multiply_uint64_hw64_generic(operand1, operand2, hw64);                         \
}
#endif

#ifndef PADIC_DIVIDE_UINT128_UINT64
#define PADIC_DIVIDE_UINT128_UINT64(numerator, denominator, quotient) {             \
    divide_uint128_uint64_inplace_generic(numerator, denominator, quotient);        \
}
#endif

#ifndef PADIC_MSB_INDEX_UINT64
#define PADIC_MSB_INDEX_UINT64(result, value) get_msb_index_generic(result, value)
#endif
