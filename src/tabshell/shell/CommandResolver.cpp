#include <tabshell/shell/CommandResolver.hpp>

#include <tabshell/shell/Similarity.hpp>

#include <cctype>
#include <optional>

namespace TS::Shell {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

auto collapse_whitespace(std::string_view text) -> std::string {
    std::string collapsed;
    collapsed.reserve(text.size());
    bool pending_space = false;
    for (char ch : trim(text)) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            pending_space = true;
            continue;
        }
        if (pending_space) {
            collapsed.push_back(' ');
            pending_space = false;
        }
        collapsed.push_back(ch);
    }
    return collapsed;
}

// Rule order is significant: first full match wins, so specific forms
// (directories, "delete all X files") come before their generic counterparts.
struct RuleSpec {
    std::vector<char const*> patterns;
    std::vector<char const*> command_template;
};

auto const& rule_specs() {
    static std::vector<RuleSpec> const specs{
        {{R"((?:create|make) (?:a )?(?:new )?(?:empty )?file (?:called |named )?(\S+))"},
         {"touch", "$1"}},
        {{R"((?:create|make) (?:a )?(?:new )?(?:directory|folder) (?:called |named )?(\S+))"},
         {"mkdir", "$1"}},
        {{R"((?:create|make) (?:a )?backup of (?:the )?file (\S+))"},
         {"cp", "$1", "$1.bak"}},
        {{R"(compress (?:the )?(?:directory|folder) (\S+))"},
         {"tar", "-czvf", "$1.tar.gz", "$1"}},
        {{R"((?:find and )?delete all (\S+) files)"},
         {"find", ".", "-name", "*.$1", "-delete"}},
        {{R"((?:remove|delete) (?:the )?(?:directory|folder) (\S+)(?: and (?:its|all its) contents| recursively)?)"},
         {"rm", "-r", "$1"}},
        {{R"((?:remove|delete) (?:the )?file (\S+))", R"((?:remove|delete) (\S+))"},
         {"rm", "$1"}},
        {{R"((?:show|display|list)(?: all)?(?: the)? (?:files|contents)(?: (?:in|of)(?: the)?(?: (?:directory|folder))?(?: (\S+))?)?)",
          R"((?:show|display|list)(?: the)? (?:directory|folder)(?: (\S+))?)",
          R"(what(?:'s| is) in(?: the)? (?:directory|folder)(?: (\S+))?)"},
         {"ls", "$1"}},
        {{R"((?:show|display|print)(?: the)? contents of(?: the)? file (\S+))",
          R"((?:show|display|print)(?: the)? file (\S+))",
          R"(read(?: the)? file (\S+))",
          R"(what(?:'s| is) in(?: the)? file (\S+))"},
         {"cat", "$1"}},
        {{R"(copy(?: the)? (?:directory|folder) (\S+)(?: and (?:its|all its) contents)? to (\S+))"},
         {"cp", "-r", "$1", "$2"}},
        {{R"(copy(?: the)?(?: file)? (\S+) to (\S+))"},
         {"cp", "$1", "$2"}},
        {{R"((?:move|rename)(?: the)?(?: file)? (\S+) to (\S+))"},
         {"mv", "$1", "$2"}},
        {{R"((?:show|display|print)(?: the)? current (?:directory|folder|path))",
          R"(where am i)",
          R"(what (?:directory|folder|path) am i in)",
          R"(what(?:'s| is)(?: the)? current (?:directory|folder|path))"},
         {"pwd"}},
        {{R"(go (?:back|up)(?: one level)?)", R"(go to(?: the)? parent (?:directory|folder))"},
         {"cd", ".."}},
        {{R"(go(?: to)?(?: the)? home(?: (?:directory|folder))?)"},
         {"cd", "~"}},
        {{R"((?:change|switch)(?: to)?(?: the)? (?:directory|folder)(?: to)? (.+))",
          R"(go to(?: the)? (?:directory|folder) (.+))",
          R"(cd(?: to)? (.+))"},
         {"cd", "$1"}},
        {{R"((?:find|search for|locate)(?: all)? files (?:named|called) (\S+))"},
         {"find", ".", "-name", "$1"}},
        {{R"((?:find|search for)(?: all)? files containing(?: the)?(?: (?:text|string|pattern))? (\S+))",
          R"(grep(?: for)? (\S+))"},
         {"grep", "-r", "$1", "."}},
        {{R"((?:show|display)(?: the)?(?: system)? (?:cpu|processor)(?: (?:information|info|usage|stats))?)",
          R"(how(?: is|'s)(?: the)? (?:cpu|processor)(?: doing)?)",
          R"(what(?:'s| is)(?: the)? (?:cpu|processor) (?:usage|load))"},
         {"cpu"}},
        {{R"((?:show|display)(?: the)?(?: system)? memory(?: (?:information|info|usage|stats))?)",
          R"(how(?: is|'s)(?: the)? memory(?: doing)?)",
          R"(what(?:'s| is)(?: the)? memory (?:usage|load))"},
         {"memory"}},
        {{R"((?:show|display|list)(?: the)?(?: running)? processes)",
          R"(what processes are running)",
          R"(what(?:'s| is) running)"},
         {"processes"}},
        {{R"((?:show|display)(?: the)?(?: system)? (?:information|info|status))",
          R"((?:show|display)(?: the)? top (?:processes|process list))",
          R"(what(?:'s| is)(?: the)?(?: system)? (?:doing|status))"},
         {"top"}},
        {{R"((?:run|execute) (.+))"},
         {"$*1"}},
    };
    return specs;
}

auto default_examples() -> std::vector<IntentExample> {
    return {
        {"create file example.txt", "Creates a new empty file"},
        {"create folder documents", "Creates a new directory"},
        {"list files", "Shows files in the current directory"},
        {"show file example.txt", "Displays the contents of a file"},
        {"delete file example.txt", "Removes a file"},
        {"delete folder old_logs", "Removes a directory and its contents"},
        {"copy file.txt to backup.txt", "Copies a file"},
        {"move file.txt to documents/", "Moves a file to a directory"},
        {"rename file.txt to newname.txt", "Renames a file"},
        {"change directory documents", "Changes to a different directory"},
        {"show current directory", "Shows the current path"},
        {"go back", "Goes up one directory level"},
        {"go home", "Returns to the home directory"},
        {"find files named *.txt", "Searches for files by name"},
        {"find files containing hello", "Searches for text in files"},
        {"show cpu information", "Displays CPU usage and information"},
        {"show memory usage", "Displays memory usage statistics"},
        {"list processes", "Shows running processes"},
        {"create backup of file important.txt", "Creates a backup copy of a file"},
        {"compress folder logs", "Packs a directory into a .tar.gz archive"},
        {"delete all tmp files", "Deletes every *.tmp file below the current directory"},
        {"run uname -a", "Runs a command as typed"},
    };
}

// Expands `$N` references inside a template token. Returns nullopt when the
// token is exactly `$N` and group N did not participate in the match.
auto expand_token(std::string const& token, std::smatch const& match) -> std::optional<std::string> {
    std::string expanded;
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] == '$' && i + 1 < token.size()
            && std::isdigit(static_cast<unsigned char>(token[i + 1])) != 0) {
            auto const group = static_cast<std::size_t>(token[i + 1] - '0');
            if (group < match.size() && match[group].matched) {
                expanded.append(match[group].str());
            } else if (token.size() == 2) {
                return std::nullopt;
            }
            ++i;
            continue;
        }
        expanded.push_back(token[i]);
    }
    return expanded;
}

} // namespace

auto ResolvedCommand::render() const -> std::string {
    std::string text = name;
    for (auto const& arg : args) {
        text.push_back(' ');
        if (arg.empty() || arg.find_first_of(" \t") != std::string::npos) {
            text.push_back('"');
            text.append(arg);
            text.push_back('"');
        } else {
            text.append(arg);
        }
    }
    return text;
}

CommandResolver::CommandResolver(std::vector<std::string> vocabulary)
    : examples_{default_examples()}
    , vocabulary_{std::move(vocabulary)} {
    auto const flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
    for (auto const& spec : rule_specs()) {
        for (auto const* pattern : spec.patterns) {
            rules_.push_back(IntentRule{std::regex{pattern, flags},
                                        std::vector<std::string>(spec.command_template.begin(),
                                                                 spec.command_template.end())});
        }
    }
}

auto CommandResolver::tokenize(std::string_view text) -> Expected<std::vector<std::string>> {
    std::vector<std::string> tokens;
    std::string              current;
    bool                     in_token = false;
    char                     quote    = '\0';

    for (std::size_t i = 0; i < text.size(); ++i) {
        char const ch = text[i];
        if (quote != '\0') {
            if (ch == quote) {
                quote = '\0';
            } else if (ch == '\\' && quote == '"' && i + 1 < text.size()
                       && (text[i + 1] == '"' || text[i + 1] == '\\')) {
                current.push_back(text[++i]);
            } else {
                current.push_back(ch);
            }
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            if (in_token) {
                tokens.push_back(std::move(current));
                current.clear();
                in_token = false;
            }
            continue;
        }
        in_token = true;
        if (ch == '"' || ch == '\'') {
            quote = ch;
        } else if (ch == '\\' && i + 1 < text.size()) {
            current.push_back(text[++i]);
        } else {
            current.push_back(ch);
        }
    }

    if (quote != '\0') {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     std::string{"unterminated "} + (quote == '"' ? "double" : "single")
                                         + " quote"});
    }
    if (in_token) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

auto CommandResolver::resolve(std::string_view raw) const -> Expected<ResolvedCommand> {
    auto const text = trim(raw);
    if (text.empty()) {
        return ResolvedCommand{};
    }
    if (text.front() == kShorthandMarker) {
        return interpret(text.substr(1));
    }

    auto tokens = tokenize(text);
    if (!tokens) {
        return std::unexpected(tokens.error());
    }
    if (tokens->empty()) {
        return ResolvedCommand{};
    }
    ResolvedCommand command;
    command.name = std::move(tokens->front());
    command.args.assign(std::make_move_iterator(tokens->begin() + 1), std::make_move_iterator(tokens->end()));
    return command;
}

auto CommandResolver::interpret(std::string_view text) const -> Expected<ResolvedCommand> {
    auto const normalized = collapse_whitespace(text);
    if (normalized.empty()) {
        return std::unexpected(Error{Error::Code::UnrecognizedIntent,
                                     "Nothing to interpret after '!'. Type 'help examples' for supported phrases."});
    }
    if (normalized.size() > kMaxRequestLength) {
        return std::unexpected(Error{Error::Code::InvalidArguments,
                                     "Request is too long to interpret (" + std::to_string(normalized.size())
                                         + " characters, limit " + std::to_string(kMaxRequestLength) + ")."});
    }

    for (auto const& rule : rules_) {
        std::smatch match;
        if (!std::regex_match(normalized, match, rule.pattern)) {
            continue;
        }

        std::vector<std::string> tokens;
        for (auto const& token : rule.command_template) {
            if (token.size() == 3 && token.starts_with("$*")) {
                auto const group = static_cast<std::size_t>(token[2] - '0');
                auto       split = tokenize(match[group].str());
                if (!split) {
                    return std::unexpected(split.error());
                }
                tokens.insert(tokens.end(), split->begin(), split->end());
                continue;
            }
            if (auto expanded = expand_token(token, match)) {
                tokens.push_back(std::move(*expanded));
            }
        }
        if (tokens.empty()) {
            break;
        }

        ResolvedCommand command;
        command.name = std::move(tokens.front());
        command.args.assign(std::make_move_iterator(tokens.begin() + 1), std::make_move_iterator(tokens.end()));
        command.is_natural_language = true;
        return command;
    }

    std::string message = "Could not interpret '" + normalized + "'.";
    auto        suggestions = suggest(normalized);
    if (suggestions.empty()) {
        message.append(" Type 'help examples' for supported phrases.");
    } else {
        message.append(" Did you mean: ");
        for (std::size_t i = 0; i < suggestions.size(); ++i) {
            if (i > 0) {
                message.append(", ");
            }
            message.append(suggestions[i]);
        }
        message.push_back('?');
    }
    return std::unexpected(Error{Error::Code::UnrecognizedIntent, std::move(message)});
}

auto CommandResolver::suggest(std::string_view text) const -> std::vector<std::string> {
    std::vector<std::string> candidates = vocabulary_;
    for (auto const& example : examples_) {
        candidates.push_back(example.phrase);
    }
    return close_matches(text, candidates, 3, 0.5);
}

} // namespace TS::Shell
