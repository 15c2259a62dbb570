#ifndef LCD_ERROR_H
#define LCD_ERROR_H

#include <stdexcept>
#include <string>

// Fatal display link failure: the physical connection is unusable.
class LcdError : public std::runtime_error {
public:
    enum class Kind {
        NotConnected,
        NoDevice,
        Io,
        Handshake,
    };

    LcdError(Kind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

#endif // LCD_ERROR_H
