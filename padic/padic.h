#pragma once

#include "smallmodulus.h"
#include "printmode.h"
#include "exactpoly.h"
#include "padicring.h"
#include "padicbase.h"
#include "polyring.h"
#include "numberfield.h"
#include "extensionring.h"
#include "extensions.h"
#include "coercion.h"
#include "extensionfunctor.h"
#include "extensionparams.h"
#include "extensionfactory.h"
#include "util/logging.h"
