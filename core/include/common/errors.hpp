#pragma once

#include <stdexcept>
#include <string>

namespace fr {
    class SourceOpenError : public std::runtime_error {
    public:
        enum class Reason {
            NotFound,        // no such file
            NoDevice,        // camera device missing
            Unreadable,      // exists, but cannot be decoded
            MissingMetadata  // opened, but size/framerate unavailable
        };

        SourceOpenError(Reason reason, const std::string& source, const std::string& detail)
            : std::runtime_error(describe_(reason, source, detail)),
              reason_(reason),
              source_(source) {}

        Reason reason() const { return reason_; }
        const std::string& source() const { return source_; }

    private:
        static std::string describe_(Reason reason, const std::string& source, const std::string& detail) {
            std::string msg;
            switch (reason) {
                case Reason::NotFound: msg = "not found: "; break;
                case Reason::NoDevice: msg = "could not find video device "; break;
                case Reason::Unreadable: msg = "could not open "; break;
                case Reason::MissingMetadata: msg = "missing stream metadata for "; break;
            }
            msg += source;
            if (!detail.empty()) msg += " (" + detail + ")";
            return msg;
        }

        Reason reason_;
        std::string source_;
    };

    class UnknownContentTypeError : public std::runtime_error {
    public:
        explicit UnknownContentTypeError(const std::string& path)
            : std::runtime_error("unknown content type: " + path) {}
    };

    class DetectionError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class WriteError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class DecodeError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class ConfigError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
}
