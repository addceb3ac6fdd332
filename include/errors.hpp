#pragma once

#include <stdexcept>
#include <string>

namespace citysuggest {

// A key that cannot be mapped onto the 27 child slots of the radix tree.
class InvalidKey : public std::invalid_argument {
public:
    explicit InvalidKey(const std::string& what) : std::invalid_argument(what) {}
};

// A null / absent value handed to RadixTree::add.
class InvalidValue : public std::invalid_argument {
public:
    explicit InvalidValue(const std::string& what) : std::invalid_argument(what) {}
};

// A non-positive population reaching the scoring step.
class InvalidPopulation : public std::invalid_argument {
public:
    explicit InvalidPopulation(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace citysuggest
