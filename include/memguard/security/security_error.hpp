#ifndef MEMGUARD_SECURITY_SECURITY_ERROR_HPP
#define MEMGUARD_SECURITY_SECURITY_ERROR_HPP

#include <stdexcept>
#include <string>

namespace memguard {

// The one error a caller sees for any denied request. The reason names the
// rule and identifiers involved, never the content that triggered it.
class SecurityViolation : public std::runtime_error {
public:
    explicit SecurityViolation(const std::string& reason)
        : std::runtime_error("security violation: " + reason)
        , reason_(reason) {}
    
    virtual ~SecurityViolation() throw() {}
    
    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

} // namespace memguard

#endif // MEMGUARD_SECURITY_SECURITY_ERROR_HPP
