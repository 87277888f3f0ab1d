#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// Ошибка входных данных: вызывающая сторона прислала некорректный каталог
// или ограничения. details содержит все найденные проблемы.
class InvalidInputError : public std::runtime_error {
public:
    explicit InvalidInputError(const std::string& msg)
        : std::runtime_error(msg), details_{msg} {}

    InvalidInputError(const std::string& msg, std::vector<std::string> details)
        : std::runtime_error(msg), details_(std::move(details)) {}

    const std::vector<std::string>& details() const { return details_; }

private:
    std::vector<std::string> details_;
};
