#pragma once
#include <stdexcept>
#include <string>

// Kevés történeti adat: betöltéskor egyszer dobjuk, nem próbálkozunk újra.
class InsufficientDataError : public std::runtime_error {
public:
    InsufficientDataError(std::size_t received, std::size_t required)
    : std::runtime_error("Not enough data for SMA calculation. Received " + std::to_string(received) +
                         " rows, but " + std::to_string(required) + " are required."),
      received_(received), required_(required) {}

    std::size_t received() const { return received_; }
    std::size_t required() const { return required_; }

private:
    std::size_t received_;
    std::size_t required_;
};

// HTTP / CSV / JSON hibák az adatforrásból
class DataSourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Hibás paraméterezés (config fájl, CLI)
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
