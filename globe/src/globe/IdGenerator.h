/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _TERRA_GLOBE_IDGENERATOR_H_
#define _TERRA_GLOBE_IDGENERATOR_H_

#include <atomic>

namespace terra { namespace globe {
    class IdGenerator final {
    public:
        explicit IdGenerator(long long firstId = 0) : _nextId(firstId) { }

        long long generateId() {
            return _nextId++;
        }

        long long peekNextId() const {
            return _nextId.load();
        }

    private:
        std::atomic<long long> _nextId;
    };
} }

#endif
