#include "TypeScanner.hpp"
#include <nlohmann/json.hpp>

namespace rtmlink {

namespace {

using json = nlohmann::json;

// Every callback returns false to end the parse as soon as the answer is known
class TopLevelStringFinder : public nlohmann::json_sax<json> {
public:
    explicit TopLevelStringFinder(std::string_view key) : m_key(key) {}

    std::optional<std::string> found;

    bool null() override { return scalar(); }
    bool boolean(bool) override { return scalar(); }
    bool number_integer(number_integer_t) override { return scalar(); }
    bool number_unsigned(number_unsigned_t) override { return scalar(); }
    bool number_float(number_float_t, const string_t&) override { return scalar(); }
    bool binary(binary_t&) override { return scalar(); }

    bool string(string_t& val) override {
        if (atTarget()) {
            found = std::move(val);
            return false;
        }
        return scalar();
    }

    bool key(string_t& val) override {
        m_armed = (m_depth == 1 && val == m_key);
        return true;
    }

    bool start_object(std::size_t) override { return enter(); }
    bool start_array(std::size_t) override {
        // top level must be an object
        if (m_depth == 0) return false;
        return enter();
    }
    bool end_object() override { return leave(); }
    bool end_array() override { return leave(); }

    bool parse_error(std::size_t, const std::string&, const json::exception&) override {
        return false;
    }

private:
    std::string_view m_key;
    std::size_t m_depth{0};
    bool m_armed{false};

    [[nodiscard]] bool atTarget() const noexcept { return m_armed && m_depth == 1; }

    // A non-string value for the key, or a scalar at the top level, settles it: no string
    bool scalar() { return !atTarget() && m_depth > 0; }

    bool enter() {
        if (atTarget()) return false;
        m_armed = false;
        ++m_depth;
        return true;
    }

    bool leave() {
        --m_depth;
        return m_depth > 0;
    }
};

} // namespace

std::optional<std::string> TypeScanner::findString(std::string_view text, std::string_view key) {
    TopLevelStringFinder finder(key);
    // false whenever the finder stops early, so the result is not an error signal
    (void)json::sax_parse(text.begin(), text.end(), &finder);
    return std::move(finder.found);
}

} // namespace rtmlink
