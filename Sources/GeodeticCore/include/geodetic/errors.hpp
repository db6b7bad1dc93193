#pragma once

#ifdef __cplusplus

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace geodetic {

/// Base class of every failure reported by the resolver.
class factory_error : public std::runtime_error {
public:
    explicit factory_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// No row for the code or name in the EPSG codespace.
class no_such_code_error : public factory_error {
public:
    no_such_code_error(const std::string& kind, const std::string& code)
        : factory_error("No code \"" + code + "\" from authority \"EPSG\" found for object of type " + kind + ".")
        , kind_(kind), code_(code) {}

    const std::string& kind() const { return kind_; }
    const std::string& code() const { return code_; }

private:
    std::string kind_;
    std::string code_;
};

/// Two or more distinct primary keys match the same name.
class ambiguous_name_error : public factory_error {
public:
    ambiguous_name_error(const std::string& name, const std::vector<std::string>& candidates)
        : factory_error(format(name, candidates)), name_(name), candidates_(candidates) {}

    const std::string& name() const { return name_; }
    const std::vector<std::string>& candidates() const { return candidates_; }

private:
    static std::string format(const std::string& name, const std::vector<std::string>& candidates) {
        std::string msg = "Name \"" + name + "\" is ambiguous because it can be understood as either ";
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (i != 0) msg += (i + 1 == candidates.size()) ? " or " : ", ";
            msg += "EPSG:" + candidates[i];
        }
        return msg + ".";
    }

    std::string name_;
    std::vector<std::string> candidates_;
};

/// Two or more rows for the same key produce non-equal objects,
/// or the same code is used in more than one table.
class duplicate_identifier_error : public factory_error {
public:
    explicit duplicate_identifier_error(const std::string& code)
        : factory_error("Duplicated identifier: EPSG:" + code + "."), code_(code) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

/// A cyclic foreign-key chain was detected while resolving an object.
class recursive_resolution_error : public factory_error {
public:
    recursive_resolution_error(const std::string& table, const std::string& code)
        : factory_error("Recursive call while creating an object of table \"" + table + "\" for code " + code + ".")
        , table_(table), code_(code) {}

    const std::string& table() const { return table_; }
    const std::string& code() const { return code_; }

private:
    std::string table_;
    std::string code_;
};

/// Null required column, unrecognized discriminator, unparsable value.
class malformed_data_error : public factory_error {
public:
    explicit malformed_data_error(const std::string& msg) : factory_error(msg) {}
};

/// The requested composition is not supported by the object model.
class unsupported_operation_error : public factory_error {
public:
    explicit unsupported_operation_error(const std::string& msg) : factory_error(msg) {}
};

/// Database failure, or use of a closed resolver.
class connectivity_error : public factory_error {
public:
    connectivity_error(const std::string& msg, const std::string& kind = {}, const std::string& code = {})
        : factory_error(kind.empty() ? msg : "Cannot create " + kind + " for code \"" + code + "\": " + msg)
        , kind_(kind), code_(code) {}

    const std::string& kind() const { return kind_; }
    const std::string& code() const { return code_; }

private:
    std::string kind_;
    std::string code_;
};

/// Reported by close() when one or more release steps failed.
/// Every failure is kept, the message is the one of the first.
class close_error : public factory_error {
public:
    close_error(const std::string& msg, std::vector<std::exception_ptr> suppressed)
        : factory_error(msg), suppressed_(std::move(suppressed)) {}

    const std::vector<std::exception_ptr>& suppressed() const { return suppressed_; }

private:
    std::vector<std::exception_ptr> suppressed_;
};

/// Invalid configuration document.
class configuration_error : public factory_error {
public:
    explicit configuration_error(const std::string& msg) : factory_error(msg) {}
};

} // namespace geodetic

#endif // __cplusplus
