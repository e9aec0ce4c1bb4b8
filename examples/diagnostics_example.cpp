#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <wary.hpp>

using namespace wary;

using TextReader = Reader<Text>;

struct Setting {
    std::string key;
    std::string value;
};

namespace {

bool is_key_char(char32_t c) {
    return (c >= U'a' && c <= U'z') || (c >= U'0' && c <= U'9') || c == U'_';
}

bool is_blank(char32_t c) {
    return c == U' ' || c == U'\t';
}

// key = value\n
ParseResult<Setting> setting(TextReader& r) {
    return r.context("read setting", [](TextReader& r) -> ParseResult<Setting> {
        auto key = r.take_while(is_key_char);
        if (key.empty()) {
            return fail(r.expected_here("setting name", "read key"));
        }
        r.skip_while(is_blank);
        if (auto eq = r.consume("="); !eq) {
            return fail(std::move(eq).error());
        }
        r.skip_while(is_blank);
        auto value = r.context("read value", "text up to end of line", [](TextReader& r) {
            return r.take_until_consume("\n");
        });
        if (!value) {
            return fail(std::move(value).error());
        }
        return Setting{key.to_string(), value->to_string()};
    });
}

ParseResult<std::vector<Setting>> settings(TextReader& r) {
    std::vector<Setting> out;
    while (!r.at_end()) {
        auto next = setting(r);
        if (!next) {
            return fail(std::move(next).error());
        }
        out.push_back(std::move(*next));
    }
    return out;
}

void parse_and_print(std::string_view label, std::string_view source, Bound bound) {
    std::cout << label << "\n";
    std::cout << std::string(label.size(), '-') << "\n";

    auto in = text(source, bound);
    if (!in) {
        std::cout << make_report(in.error(), input(source)) << "\n";
        return;
    }
    auto result = in->read_all(settings);
    if (result) {
        for (const auto& s : *result) {
            std::cout << "  " << s.key << " => \"" << s.value << "\"\n";
        }
    } else if (result.error().is_retryable()) {
        std::cout << "  incomplete (" << result.error().retry_requirement()
                  << "), retry with at least "
                  << result.error().retry_requirement().continue_after() << " more byte(s)\n";
    } else {
        std::cout << make_report(result.error(), *in);
    }
    std::cout << "\n";
}

} // namespace

int main() {
    std::cout << "WARY Diagnostics Examples\n";
    std::cout << "=========================\n\n";

    parse_and_print("1. Well-formed settings", "name = wary\nlevel = 3\n", Bound::both);

    parse_and_print("2. Missing '='", "name = wary\nlevel 3\n", Bound::both);

    parse_and_print("3. Wide characters under the caret",
                    "lang = en\ntitle = \xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E", Bound::both);

    parse_and_print("4. Unterminated line, more input may follow", "name = wa", Bound::start);

    parse_and_print("5. Same line, input is final", "name = wa", Bound::both);

    parse_and_print("6. Invalid UTF-8", "name = \xFF\n", Bound::both);

    return 0;
}
