#pragma once
#include <stdexcept>
#include <string>

namespace MkToken {

    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string &msg) : std::runtime_error(msg) {}
    };

    class InvalidEncoding : public Error {
    public:
        using Error::Error;
    };

    class InvalidOption : public Error {
    public:
        using Error::Error;
    };

    class OutOfRange : public Error {
    public:
        using Error::Error;
    };

    class InvalidType : public Error {
    public:
        using Error::Error;
    };

    class InvalidMarketplaceId : public Error {
    public:
        using Error::Error;
    };

    class InvalidEnvironment : public Error {
    public:
        using Error::Error;
    };

    class InvalidPrefix : public Error {
    public:
        using Error::Error;
    };

    class LengthError : public Error {
    public:
        using Error::Error;
    };

    class RandomSourceError : public Error {
    public:
        using Error::Error;
    };

    class DecodeError : public Error {
    public:
        using Error::Error;
    };

    class ConfigError : public Error {
    public:
        using Error::Error;
    };
}
