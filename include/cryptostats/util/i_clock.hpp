#ifndef ICLOCK_HPP
#define ICLOCK_HPP

#include "cryptostats/util/timestamp.hpp"

namespace cryptostats::util {

    class IClock {
    public:
        virtual ~IClock() = default;
        virtual Timestamp now() const = 0;
    };

} 

#endif
