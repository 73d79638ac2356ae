#ifndef SPINLOGO_COMMON_ERRORS_HPP
#define SPINLOGO_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace spinlogo {

// A computation was asked to evaluate a function outside its domain
// (conformal map through the origin, degenerate joint angle).
class DomainError : public std::runtime_error {
public:
    explicit DomainError(const std::string& msg) : std::runtime_error(msg) {}
};

// Export requested for layers that contain no points
class EmptyGeometryError : public std::runtime_error {
public:
    explicit EmptyGeometryError(const std::string& msg) : std::runtime_error(msg) {}
};

// Reading or writing a file failed. A failed write may leave a partial file.
class IOFailure : public std::runtime_error {
public:
    explicit IOFailure(const std::string& msg) : std::runtime_error(msg) {}
};

// Validation result for user supplied parameters
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    void add_warning(const std::string& msg) {
        warnings.push_back(msg);
    }

    void add_error(const std::string& msg) {
        errors.push_back(msg);
        valid = false;
    }

    void merge(const ValidationResult& other) {
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
        for (const auto& e : other.errors) {
            add_error(e);
        }
    }
};

}  // namespace spinlogo

#endif // SPINLOGO_COMMON_ERRORS_HPP
