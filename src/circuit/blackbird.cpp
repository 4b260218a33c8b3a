#include "starship/circuit/blackbird.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <stdexcept>

namespace starship {

// ─────────────────────────────────────────────────────────────────────────────
// Program
// ─────────────────────────────────────────────────────────────────────────────

Program::Program(std::size_t num_modes, std::string name)
    : name_(std::move(name))
    , num_modes_(num_modes)
{
    if (num_modes_ == 0) {
        throw std::invalid_argument("Program requires at least one mode");
    }
}

Program& Program::apply(std::string op, std::vector<double> params, std::vector<int> modes) {
    if (op.empty()) {
        throw std::invalid_argument("Operation name cannot be empty");
    }
    if (modes.empty()) {
        throw std::invalid_argument("Operation " + op + " must act on at least one mode");
    }
    for (const int mode : modes) {
        if (mode < 0 || static_cast<std::size_t>(mode) >= num_modes_) {
            throw std::invalid_argument(std::format(
                "Operation {} acts on mode {} but the program has {} modes", op, mode, num_modes_));
        }
    }
    operations_.push_back(Operation{std::move(op), std::move(params), std::move(modes)});
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// Parsing helpers
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::string_view strip_comment(std::string_view line) {
    const auto hash = line.find('#');
    if (hash != std::string_view::npos) {
        line = line.substr(0, hash);
    }
    return line;
}

bool is_identifier(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

// "keyword rest" -> rest when the first word equals keyword
std::optional<std::string_view> header_value(std::string_view line, std::string_view keyword) {
    if (line.size() <= keyword.size() || line.substr(0, keyword.size()) != keyword) {
        return std::nullopt;
    }
    if (!std::isspace(static_cast<unsigned char>(line[keyword.size()]))) {
        return std::nullopt;
    }
    return trim(line.substr(keyword.size()));
}

ApiResult<BlackbirdTarget> parse_target(std::string_view line) {
    BlackbirdTarget target;

    const auto paren = line.find('(');
    target.name = std::string(trim(line.substr(0, paren)));
    if (!is_identifier(target.name)) {
        return tl::unexpected(ApiError::invalid_program(
            "Invalid target name '" + target.name + "'"));
    }
    if (paren == std::string_view::npos) {
        return target;
    }

    std::string_view options = trim(line.substr(paren + 1));
    if (options.empty() || options.back() != ')') {
        return tl::unexpected(ApiError::invalid_program("Unterminated target options"));
    }
    options.remove_suffix(1);

    while (!trim(options).empty()) {
        const auto comma = options.find(',');
        const std::string_view entry = trim(options.substr(0, comma));
        options = (comma == std::string_view::npos) ? std::string_view{} : options.substr(comma + 1);
        if (entry.empty()) {
            continue;
        }
        const auto eq = entry.find('=');
        if (eq == std::string_view::npos) {
            return tl::unexpected(ApiError::invalid_program(
                "Target option '" + std::string(entry) + "' is not of the form key=value"));
        }
        const std::string key(trim(entry.substr(0, eq)));
        const std::string value(trim(entry.substr(eq + 1)));
        if (!is_identifier(key) || value.empty()) {
            return tl::unexpected(ApiError::invalid_program(
                "Invalid target option '" + std::string(entry) + "'"));
        }
        target.options.emplace_back(key, value);
    }
    return target;
}

std::string format_operation(const Operation& op) {
    std::string line = op.name;
    if (!op.params.empty()) {
        line += '(';
        for (std::size_t i = 0; i < op.params.size(); ++i) {
            if (i > 0) line += ", ";
            line += std::format("{}", op.params[i]);
        }
        line += ')';
    }
    line += " | ";
    if (op.modes.size() == 1) {
        line += std::to_string(op.modes.front());
    } else {
        line += '[';
        for (std::size_t i = 0; i < op.modes.size(); ++i) {
            if (i > 0) line += ", ";
            line += std::to_string(op.modes[i]);
        }
        line += ']';
    }
    return line;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// BlackbirdScript
// ─────────────────────────────────────────────────────────────────────────────

ApiResult<BlackbirdScript> BlackbirdScript::parse(std::string_view text) {
    BlackbirdScript script;
    bool in_body = false;

    std::size_t line_start = 0;
    while (line_start <= text.size()) {
        const auto line_end = text.find('\n', line_start);
        const std::string_view raw = text.substr(
            line_start,
            (line_end == std::string_view::npos ? text.size() : line_end) - line_start);
        line_start = (line_end == std::string_view::npos) ? text.size() + 1 : line_end + 1;

        const std::string_view line = trim(strip_comment(raw));
        if (line.empty()) {
            continue;
        }

        if (!in_body) {
            if (auto value = header_value(line, "name")) {
                script.name_ = std::string(*value);
                continue;
            }
            if (auto value = header_value(line, "version")) {
                script.version_ = std::string(*value);
                continue;
            }
            if (auto value = header_value(line, "target")) {
                auto target = parse_target(*value);
                if (!target) {
                    return tl::unexpected(target.error());
                }
                script.target_ = std::move(*target);
                continue;
            }
            in_body = true;
        }
        script.body_.emplace_back(trim(raw));
    }

    if (script.name_.empty()) {
        return tl::unexpected(ApiError::invalid_program("Blackbird script has no 'name' line"));
    }
    if (script.version_.empty()) {
        return tl::unexpected(ApiError::invalid_program("Blackbird script has no 'version' line"));
    }
    return script;
}

BlackbirdScript BlackbirdScript::from_program(const Program& program) {
    BlackbirdScript script;
    script.name_ = program.name();
    script.version_ = program.version();
    for (const auto& op : program.operations()) {
        script.body_.push_back(format_operation(op));
    }
    return script;
}

BlackbirdScript& BlackbirdScript::with_target(const std::string& target, int shots) {
    target_ = BlackbirdTarget{target, {{"shots", std::to_string(shots)}}};
    return *this;
}

std::optional<int> BlackbirdScript::shots() const {
    if (!target_) {
        return std::nullopt;
    }
    for (const auto& [key, value] : target_->options) {
        if (key != "shots") {
            continue;
        }
        int shots = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), shots);
        if (ec == std::errc{} && ptr == value.data() + value.size()) {
            return shots;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::string BlackbirdScript::serialize() const {
    std::string out = "name " + name_ + "\n";
    out += "version " + version_ + "\n";
    if (target_) {
        out += "target " + target_->name;
        if (!target_->options.empty()) {
            out += " (";
            for (std::size_t i = 0; i < target_->options.size(); ++i) {
                if (i > 0) out += ", ";
                out += target_->options[i].first + "=" + target_->options[i].second;
            }
            out += ')';
        }
        out += '\n';
    }
    out += '\n';
    for (const auto& line : body_) {
        out += line;
        out += '\n';
    }
    return out;
}

std::string to_blackbird(const Program& program, const std::string& target, int shots) {
    return BlackbirdScript::from_program(program).with_target(target, shots).serialize();
}

}  // namespace starship
