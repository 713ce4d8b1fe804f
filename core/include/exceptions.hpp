#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class KlineFetcherException : public std::runtime_error {
    public:
        explicit KlineFetcherException(const std::string& message)
            : std::runtime_error(message) {}

        explicit KlineFetcherException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public KlineFetcherException {
    public: using KlineFetcherException::KlineFetcherException; };

    class DataLoadException : public KlineFetcherException {
    public: using KlineFetcherException::KlineFetcherException; };

    class ApiRequestException : public KlineFetcherException {
    public: using KlineFetcherException::KlineFetcherException; };

} // namespace core
