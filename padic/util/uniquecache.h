#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace padic
{
    namespace util
    {
        /**
        Keeps at most one live object per key. The cache holds weak references only, so an object is
        released as soon as its last user drops it, and a later request with the same key creates it again.
        Entries of released objects are erased whenever a new object is stored.

        @par Thread Safety
        acquire() is thread-safe.
        */
        template<typename T>
        class UniqueCache
        {
        public:
            /**
            Returns the live object stored under key, or stores and returns the object made by create().
            create() runs under the cache lock and must not call back into the same cache.

            @param[in] key The identity of the object
            @param[in] create Callable returning std::shared_ptr<const T>
            @param[out] created Set to whether create() was called
            */
            template<typename Creator>
            std::shared_ptr<const T> acquire(const std::string &key, Creator create, bool &created)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                created = false;
                auto found = objects_.find(key);
                if (found != objects_.end())
                {
                    std::shared_ptr<const T> existing = found->second.lock();
                    if (existing)
                    {
                        return existing;
                    }
                }
                std::shared_ptr<const T> fresh = create();
                for (auto it = objects_.begin(); it != objects_.end(); )
                {
                    if (it->second.expired())
                    {
                        it = objects_.erase(it);
                    }
                    else
                    {
                        ++it;
                    }
                }
                objects_[key] = fresh;
                created = true;
                return fresh;
            }

            /**
            Returns the number of live objects.
            */
            std::size_t size() const
            {
                std::lock_guard<std::mutex> lock(mutex_);
                std::size_t live = 0;
                for (const auto &entry : objects_)
                {
                    if (!entry.second.expired())
                    {
                        live++;
                    }
                }
                return live;
            }

        private:
            mutable std::mutex mutex_;

            std::map<std::string, std::weak_ptr<const T> > objects_;
        };
    }
}
