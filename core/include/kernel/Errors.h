#pragma once

#include <stdexcept>
#include <string>

// Pattern of the wrong length, or with an element outside {0, 1}
class InvalidPatternError : public std::invalid_argument {
public:
    explicit InvalidPatternError(const std::string& what) : std::invalid_argument(what) {}
};

// Pool capacity of 0, or an agent built with no memes
class EmptyPoolError : public std::invalid_argument {
public:
    explicit EmptyPoolError(const std::string& what) : std::invalid_argument(what) {}
};

// Grid::replaceAll() handed the wrong number of agents (or agents in the wrong slots)
class CountMismatchError : public std::logic_error {
public:
    explicit CountMismatchError(const std::string& what) : std::logic_error(what) {}
};
