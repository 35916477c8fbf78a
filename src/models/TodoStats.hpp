#ifndef TODOSTATS_HPP
#define TODOSTATS_HPP

#include <cstddef>

struct TodoStats {
    std::size_t total = 0;
    std::size_t completed = 0;
    std::size_t pending = 0;
};

#endif // TODOSTATS_HPP
