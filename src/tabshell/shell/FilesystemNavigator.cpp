#include <tabshell/shell/FilesystemNavigator.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace TS::Shell {

namespace fs = std::filesystem;

namespace {

// Never removed or moved, sandbox or not.
constexpr std::array<std::string_view, 13> kProtectedSystemPaths{
    "/", "/home", "/root", "/boot", "/etc", "/usr", "/var", "/bin", "/sbin", "/lib", "/dev", "/proc", "/sys"};

struct Flags {
    bool                     all{false};
    bool                     long_format{false};
    bool                     recursive{false};
    bool                     force{false};
    bool                     parents{false};
    std::vector<std::string> operands;
};

auto parse_flags(std::vector<std::string> const& args) -> Flags {
    Flags flags;
    bool  operands_only = false;
    for (auto const& arg : args) {
        if (!operands_only && arg == "--") {
            operands_only = true;
            continue;
        }
        if (!operands_only && arg.size() > 1 && arg.front() == '-') {
            for (char ch : std::string_view{arg}.substr(1)) {
                switch (ch) {
                case 'a':
                    flags.all = true;
                    break;
                case 'l':
                    flags.long_format = true;
                    break;
                case 'r':
                case 'R':
                    flags.recursive = true;
                    break;
                case 'f':
                    flags.force = true;
                    break;
                case 'p':
                    flags.parents = true;
                    break;
                default:
                    break;
                }
            }
            continue;
        }
        flags.operands.push_back(arg);
    }
    return flags;
}

auto strip_trailing_separator(fs::path path) -> fs::path {
    auto text = path.string();
    while (text.size() > 1 && text.back() == '/') {
        text.pop_back();
    }
    return fs::path{text};
}

auto is_same_or_inside(fs::path const& candidate, fs::path const& root) -> bool {
    auto root_it      = root.begin();
    auto candidate_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++candidate_it) {
        if (root_it->empty()) {
            continue;
        }
        if (candidate_it == candidate.end() || *candidate_it != *root_it) {
            return false;
        }
    }
    return true;
}

// Canonical where the path exists, lexical otherwise.
auto canonical_or_lexical(fs::path const& path) -> fs::path {
    std::error_code ec;
    auto            resolved = fs::weakly_canonical(path, ec);
    if (ec) {
        return strip_trailing_separator(path.lexically_normal());
    }
    return strip_trailing_separator(resolved);
}

auto code_for(std::error_code const& ec) -> Error::Code {
    if (ec == std::errc::no_such_file_or_directory) {
        return Error::Code::NotFound;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted
        || ec == std::errc::read_only_file_system) {
        return Error::Code::PermissionDenied;
    }
    if (ec == std::errc::file_exists) {
        return Error::Code::AlreadyExists;
    }
    if (ec == std::errc::not_a_directory) {
        return Error::Code::NotADirectory;
    }
    return Error::Code::InvalidArguments;
}

auto describe(std::error_code const& ec) -> std::string {
    switch (code_for(ec)) {
    case Error::Code::NotFound:
        return "No such file or directory";
    case Error::Code::PermissionDenied:
        return "Permission denied";
    case Error::Code::AlreadyExists:
        return "File exists";
    case Error::Code::NotADirectory:
        return "Not a directory";
    default:
        break;
    }
    return ec.message();
}

// Accumulates one line per operand; the first failure decides the error code.
class Report {
public:
    void ok(std::string line) { lines_.push_back(std::move(line)); }

    void fail(Error::Code code, std::string line) {
        if (!failure_) {
            failure_ = code;
        }
        lines_.push_back(std::move(line));
    }

    auto finish(std::optional<std::string> new_directory = std::nullopt) -> Expected<NavigatorResult> {
        std::string text;
        for (std::size_t i = 0; i < lines_.size(); ++i) {
            if (i > 0) {
                text.push_back('\n');
            }
            text.append(lines_[i]);
        }
        if (failure_) {
            return std::unexpected(Error{*failure_, std::move(text)});
        }
        return NavigatorResult{std::move(text), std::move(new_directory)};
    }

private:
    std::vector<std::string>   lines_;
    std::optional<Error::Code> failure_;
};

auto missing_operand(std::string_view command, std::string_view what = "operand") -> Error {
    return Error{Error::Code::InvalidArguments,
                 std::string{command} + ": missing " + std::string{what}};
}

auto format_permissions(fs::file_status const& status) -> std::string {
    std::string text;
    text.push_back(fs::is_directory(status) ? 'd' : (fs::is_symlink(status) ? 'l' : '-'));
    auto const perms = status.permissions();
    constexpr std::array<std::pair<fs::perms, char>, 9> kBits{{
        {fs::perms::owner_read, 'r'},
        {fs::perms::owner_write, 'w'},
        {fs::perms::owner_exec, 'x'},
        {fs::perms::group_read, 'r'},
        {fs::perms::group_write, 'w'},
        {fs::perms::group_exec, 'x'},
        {fs::perms::others_read, 'r'},
        {fs::perms::others_write, 'w'},
        {fs::perms::others_exec, 'x'},
    }};
    for (auto const& [bit, ch] : kBits) {
        text.push_back((perms & bit) != fs::perms::none ? ch : '-');
    }
    return text;
}

auto format_mtime(fs::file_time_type stamp) -> std::string {
    auto const system_time = std::chrono::file_clock::to_sys(stamp);
    auto const raw         = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(system_time));
    std::tm tm{};
    if (localtime_r(&raw, &tm) == nullptr) {
        return "??? ?? ??:??";
    }
    std::ostringstream oss;
    oss << std::put_time(&tm, "%b %d %H:%M");
    return oss.str();
}

auto format_entry(fs::directory_entry const& entry, bool long_format) -> std::string {
    std::error_code ec;
    auto            name   = entry.path().filename().string();
    bool const      is_dir = entry.is_directory(ec);
    if (is_dir) {
        name.push_back('/');
    }
    if (!long_format) {
        return name;
    }

    auto const status = entry.symlink_status(ec);
    if (ec) {
        return "?????????? ???????? ??? ?? ??:?? " + name;
    }
    std::uintmax_t size = 0;
    if (!is_dir) {
        size = entry.file_size(ec);
        if (ec) {
            size = 0;
        }
    }
    auto mtime = entry.last_write_time(ec);

    std::ostringstream line;
    line << format_permissions(status) << ' ' << std::setw(8) << size << ' '
         << (ec ? std::string{"??? ?? ??:??"} : format_mtime(mtime)) << ' ' << name;
    return line.str();
}

} // namespace

FilesystemNavigator::FilesystemNavigator(NavigatorConfig config)
    : config_{std::move(config)} {
    if (config_.home_directory.empty()) {
        std::error_code ec;
        config_.home_directory = fs::current_path(ec).string();
    }
    config_.home_directory = strip_trailing_separator(fs::path{config_.home_directory}.lexically_normal()).string();
    if (config_.sandbox_root && !config_.sandbox_root->empty()) {
        canonical_sandbox_ = canonical_or_lexical(fs::path{*config_.sandbox_root});
    } else {
        config_.sandbox_root.reset();
    }
}

auto FilesystemNavigator::resolve_path(std::string const& cwd, std::string_view target) const -> fs::path {
    fs::path resolved;
    if (target.empty()) {
        resolved = fs::path{cwd};
    } else if (target == "~") {
        resolved = fs::path{config_.home_directory};
    } else if (target.starts_with("~/")) {
        resolved = fs::path{config_.home_directory} / fs::path{std::string{target.substr(2)}};
    } else {
        fs::path candidate{std::string{target}};
        resolved = candidate.is_absolute() ? candidate : fs::path{cwd} / candidate;
    }
    return strip_trailing_separator(resolved.lexically_normal());
}

auto FilesystemNavigator::is_within_sandbox(fs::path const& path) const -> bool {
    if (!canonical_sandbox_) {
        return true;
    }
    return is_same_or_inside(canonical_or_lexical(path), *canonical_sandbox_);
}

auto FilesystemNavigator::is_protected(fs::path const& path) const -> bool {
    auto const lexical = strip_trailing_separator(path.lexically_normal()).string();
    auto const real    = canonical_or_lexical(path).string();
    for (auto banned : kProtectedSystemPaths) {
        if (lexical == banned || real == banned) {
            return true;
        }
    }
    if (canonical_sandbox_ && real == canonical_sandbox_->string()) {
        return true;
    }
    return !is_within_sandbox(path);
}

auto FilesystemNavigator::nearest_existing_directory(fs::path const& path) const -> std::string {
    auto candidate = strip_trailing_separator(path.lexically_normal());
    while (true) {
        std::error_code ec;
        if (fs::is_directory(candidate, ec) && is_within_sandbox(candidate)) {
            return candidate.string();
        }
        if (!candidate.has_parent_path() || candidate.parent_path() == candidate) {
            break;
        }
        candidate = candidate.parent_path();
    }
    if (config_.sandbox_root) {
        return canonical_sandbox_->string();
    }
    return config_.home_directory;
}

auto FilesystemNavigator::relocate_if_affected(std::string const&                 cwd,
                                               fs::path const&                    removed,
                                               std::optional<fs::path> const&     replacement) const
    -> std::optional<std::string> {
    auto const current = strip_trailing_separator(fs::path{cwd}.lexically_normal());
    if (!is_same_or_inside(current, removed)) {
        return std::nullopt;
    }
    if (replacement) {
        auto suffix = current.lexically_relative(removed);
        auto moved  = suffix.empty() || suffix == "." ? *replacement : *replacement / suffix;
        return strip_trailing_separator(moved.lexically_normal()).string();
    }
    return nearest_existing_directory(removed.parent_path());
}

auto FilesystemNavigator::list(std::string const& cwd, std::vector<std::string> const& args) const
    -> Expected<NavigatorResult> {
    auto flags = parse_flags(args);
    if (flags.operands.empty()) {
        flags.operands.push_back(".");
    }

    Report report;
    bool const with_headers = flags.operands.size() > 1;
    for (auto const& operand : flags.operands) {
        auto const path = resolve_path(cwd, operand);
        if (!is_within_sandbox(path)) {
            report.fail(Error::Code::Forbidden,
                        "ls: cannot access '" + operand + "': Outside of sandbox root");
            continue;
        }
        std::error_code ec;
        auto const      status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            report.fail(Error::Code::NotFound,
                        "ls: cannot access '" + operand + "': No such file or directory");
            continue;
        }
        if (!fs::is_directory(status)) {
            report.ok(format_entry(fs::directory_entry{path, ec}, flags.long_format));
            continue;
        }

        std::vector<fs::directory_entry> entries;
        for (fs::directory_iterator it{path, ec}, end; !ec && it != end; it.increment(ec)) {
            auto name = it->path().filename().string();
            if (!flags.all && name.starts_with('.')) {
                continue;
            }
            entries.push_back(*it);
        }
        if (ec) {
            auto code = code_for(ec);
            report.fail(code == Error::Code::InvalidArguments ? Error::Code::PermissionDenied : code,
                        "ls: cannot open directory '" + operand + "': " + describe(ec));
            continue;
        }
        std::sort(entries.begin(), entries.end(), [](auto const& a, auto const& b) {
            return a.path().filename() < b.path().filename();
        });

        std::string listing;
        if (entries.empty()) {
            listing = "(empty directory)";
        } else {
            auto const separator = flags.long_format ? std::string_view{"\n"} : std::string_view{"  "};
            for (std::size_t i = 0; i < entries.size(); ++i) {
                if (i > 0) {
                    listing.append(separator);
                }
                listing.append(format_entry(entries[i], flags.long_format));
            }
        }
        if (with_headers) {
            listing = operand + ":\n" + listing;
        }
        report.ok(std::move(listing));
    }
    return report.finish();
}

auto FilesystemNavigator::change_directory(std::string const& cwd, std::vector<std::string> const& args) const
    -> Expected<NavigatorResult> {
    if (args.size() > 1) {
        return std::unexpected(Error{Error::Code::InvalidArguments, "cd: too many arguments"});
    }
    std::string const target = args.empty() ? std::string{"~"} : args.front();
    auto const        path   = resolve_path(cwd, target);

    if (!is_within_sandbox(path)) {
        return std::unexpected(Error{Error::Code::Forbidden, "cd: " + target + ": Outside of sandbox root"});
    }
    std::error_code ec;
    auto const      status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return std::unexpected(Error{Error::Code::NotFound, "cd: " + target + ": No such file or directory"});
    }
    if (!fs::is_directory(status)) {
        return std::unexpected(Error{Error::Code::NotADirectory, "cd: " + target + ": Not a directory"});
    }
    if (::access(path.c_str(), X_OK) != 0) {
        return std::unexpected(Error{Error::Code::PermissionDenied, "cd: " + target + ": Permission denied"});
    }
    return NavigatorResult{"Changed directory to: " + path.string(), path.string()};
}

auto FilesystemNavigator::make_directory(std::string const& cwd, std::vector<std::string> const& args) const
    -> Expected<NavigatorResult> {
    auto const flags = parse_flags(args);
    if (flags.operands.empty()) {
        return std::unexpected(missing_operand("mkdir"));
    }

    Report report;
    for (auto const& operand : flags.operands) {
        auto const path = resolve_path(cwd, operand);
        if (!is_within_sandbox(path)) {
            report.fail(Error::Code::Forbidden,
                        "mkdir: cannot create directory '" + operand + "': Outside of sandbox root");
            continue;
        }
        std::error_code ec;
        if (fs::exists(path, ec)) {
            if (flags.parents && fs::is_directory(path, ec)) {
                report.ok("Directory exists: " + path.string());
            } else {
                report.fail(Error::Code::AlreadyExists,
                            "mkdir: cannot create directory '" + operand + "': File exists");
            }
            continue;
        }
        bool const created = flags.parents ? fs::create_directories(path, ec) : fs::create_directory(path, ec);
        if (ec || !created) {
            report.fail(ec ? code_for(ec) : Error::Code::AlreadyExists,
                        "mkdir: cannot create directory '" + operand + "': "
                            + (ec ? describe(ec) : std::string{"File exists"}));
            continue;
        }
        report.ok("Directory created: " + path.string());
    }
    return report.finish();
}

auto FilesystemNavigator::remove_directory(std::string const& cwd, std::vector<std::string> const& args) const
    -> Expected<NavigatorResult> {
    auto const flags = parse_flags(args);
    if (flags.operands.empty()) {
        return std::unexpected(missing_operand("rmdir"));
    }

    Report                     report;
    std::optional<std::string> new_directory;
    for (auto const& operand : flags.operands) {
        auto const path = resolve_path(cwd, operand);
        if (is_protected(path)) {
            report.fail(Error::Code::Forbidden, "rmdir: refusing to remove '" + operand + "': Protected path");
            continue;
        }
        std::error_code ec;
        auto const      status = fs::symlink_status(path, ec);
        if (ec || !fs::exists(status)) {
            report.fail(Error::Code::NotFound,
                        "rmdir: failed to remove '" + operand + "': No such file or directory");
            continue;
        }
        if (!fs::is_directory(status)) {
            report.fail(Error::Code::NotADirectory, "rmdir: failed to remove '" + operand + "': Not a directory");
            continue;
        }
        if (!fs::is_empty(path, ec)) {
            report.fail(Error::Code::InvalidArguments,
                        "rmdir: failed to remove '" + operand + "': Directory not empty");
            continue;
        }
        if (!fs::remove(path, ec) || ec) {
            report.fail(ec ? code_for(ec) : Error::Code::NotFound,
                        "rmdir: failed to remove '" + operand + "': "
                            + (ec ? describe(ec) : std::string{"No such file or directory"}));
            continue;
        }
        report.ok("Directory removed: " + path.string());
        if (!new_directory) {
            new_directory = relocate_if_affected(cwd, path, std::nullopt);
        }
    }
    return report.finish(std::move(new_directory));
}

auto FilesystemNavigator::remove(std::string const& cwd, std::vector<std::string> const& args) const
    -> Expected<NavigatorResult> {
    auto const flags = parse_flags(args);
    if (flags.operands.empty()) {
        return std::unexpected(missing_operand("rm"));
    }

    Report                     report;
    std::optional<std::string> new_directory;
    for (auto const& operand : flags.operands) {
        auto const path = resolve_path(cwd, operand);
        if (is_protected(path)) {
            report.fail(Error::Code::Forbidden, "rm: refusing to remove '" + operand + "': Protected path");
            continue;
        }
        std::error_code ec;
        auto const      status = fs::symlink_status(path, ec);
        if (ec || !fs::exists(status)) {
            if (!flags.force) {
                report.fail(Error::Code::NotFound,
                            "rm: cannot remove '" + operand + "': No such file or directory");
            }
            continue;
        }
        if (fs::is_directory(status)) {
            if (!flags.recursive) {
                report.fail(Error::Code::InvalidArguments, "rm: cannot remove '" + operand + "': Is a directory");
                continue;
            }
            fs::remove_all(path, ec);
            if (ec) {
                report.fail(code_for(ec), "rm: cannot remove '" + operand + "': " + describe(ec));
                continue;
            }
            report.ok("Removed directory: " + path.string());
            if (!new_directory) {
                new_directory = relocate_if_affected(cwd, path, std::nullopt);
            }
            continue;
        }
        fs::remove(path, ec);
        if (ec) {
            report.fail(code_for(ec), "rm: cannot remove '" + operand + "': " + describe(ec));
            continue;
        }
        report.ok("Removed file: " + path.string());
    }
    return report.finish(std::move(new_directory));
}

auto FilesystemNavigator::copy(std::string const& cwd, std::vector<std::string> const& args) const
    -> Expected<NavigatorResult> {
    auto const flags = parse_flags(args);
    if (flags.operands.empty()) {
        return std::unexpected(missing_operand("cp", "file operand"));
    }
    if (flags.operands.size() < 2) {
        return std::unexpected(Error{Error::Code::InvalidArguments,
                                     "cp: missing destination file operand after '" + flags.operands.front() + "'"});
    }

    auto const&     destination_arg = flags.operands.back();
    auto const      destination     = resolve_path(cwd, destination_arg);
    std::error_code ec;
    bool const      destination_is_dir = fs::is_directory(destination, ec);
    if (flags.operands.size() > 2 && !destination_is_dir) {
        return std::unexpected(Error{Error::Code::NotADirectory,
                                     "cp: target '" + destination_arg + "' is not a directory"});
    }
    if (!is_within_sandbox(destination)) {
        return std::unexpected(Error{Error::Code::Forbidden,
                                     "cp: cannot create '" + destination_arg + "': Outside of sandbox root"});
    }

    Report report;
    for (std::size_t i = 0; i + 1 < flags.operands.size(); ++i) {
        auto const& operand = flags.operands[i];
        auto const  source  = resolve_path(cwd, operand);
        if (!is_within_sandbox(source)) {
            report.fail(Error::Code::Forbidden, "cp: cannot stat '" + operand + "': Outside of sandbox root");
            continue;
        }
        auto const status = fs::status(source, ec);
        if (ec || !fs::exists(status)) {
            report.fail(Error::Code::NotFound, "cp: cannot stat '" + operand + "': No such file or directory");
            continue;
        }
        auto target = destination_is_dir ? destination / source.filename() : destination;

        if (fs::is_directory(status)) {
            if (!flags.recursive) {
                report.fail(Error::Code::InvalidArguments,
                            "cp: -r not specified; omitting directory '" + operand + "'");
                continue;
            }
            if (is_same_or_inside(canonical_or_lexical(target), canonical_or_lexical(source))) {
                report.fail(Error::Code::InvalidArguments,
                            "cp: cannot copy a directory, '" + operand + "', into itself");
                continue;
            }
            if (fs::exists(target, ec) && !fs::is_directory(target, ec)) {
                report.fail(Error::Code::AlreadyExists,
                            "cp: cannot overwrite non-directory '" + target.string() + "' with directory '"
                                + operand + "'");
                continue;
            }
            fs::copy(source, target, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
            if (ec) {
                report.fail(code_for(ec), "cp: cannot copy '" + operand + "': " + describe(ec));
                continue;
            }
            report.ok("Copied directory: " + source.string() + " -> " + target.string());
            continue;
        }

        if (canonical_or_lexical(target) == canonical_or_lexical(source)) {
            report.fail(Error::Code::InvalidArguments,
                        "cp: '" + operand + "' and '" + target.string() + "' are the same file");
            continue;
        }
        fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            report.fail(code_for(ec), "cp: cannot copy '" + operand + "': " + describe(ec));
            continue;
        }
        report.ok("Copied file: " + source.string() + " -> " + target.string());
    }
    return report.finish();
}

auto FilesystemNavigator::move(std::string const& cwd, std::vector<std::string> const& args) const
    -> Expected<NavigatorResult> {
    auto const flags = parse_flags(args);
    if (flags.operands.empty()) {
        return std::unexpected(missing_operand("mv", "file operand"));
    }
    if (flags.operands.size() < 2) {
        return std::unexpected(Error{Error::Code::InvalidArguments,
                                     "mv: missing destination file operand after '" + flags.operands.front() + "'"});
    }

    auto const&     destination_arg = flags.operands.back();
    auto const      destination     = resolve_path(cwd, destination_arg);
    std::error_code ec;
    bool const      destination_is_dir = fs::is_directory(destination, ec);
    if (flags.operands.size() > 2 && !destination_is_dir) {
        return std::unexpected(Error{Error::Code::NotADirectory,
                                     "mv: target '" + destination_arg + "' is not a directory"});
    }
    if (!is_within_sandbox(destination)) {
        return std::unexpected(Error{Error::Code::Forbidden,
                                     "mv: cannot move to '" + destination_arg + "': Outside of sandbox root"});
    }

    Report                     report;
    std::optional<std::string> new_directory;
    for (std::size_t i = 0; i + 1 < flags.operands.size(); ++i) {
        auto const& operand = flags.operands[i];
        auto const  source  = resolve_path(cwd, operand);
        if (is_protected(source)) {
            report.fail(Error::Code::Forbidden, "mv: refusing to move '" + operand + "': Protected path");
            continue;
        }
        auto const status = fs::symlink_status(source, ec);
        if (ec || !fs::exists(status)) {
            report.fail(Error::Code::NotFound, "mv: cannot stat '" + operand + "': No such file or directory");
            continue;
        }
        auto target = destination_is_dir ? destination / source.filename() : destination;
        if (fs::is_directory(status) && is_same_or_inside(canonical_or_lexical(target), canonical_or_lexical(source))) {
            report.fail(Error::Code::InvalidArguments,
                        "mv: cannot move '" + operand + "' to a subdirectory of itself");
            continue;
        }

        fs::rename(source, target, ec);
        if (ec == std::errc::cross_device_link) {
            ec.clear();
            fs::copy(source, target, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
            if (!ec) {
                fs::remove_all(source, ec);
            }
        }
        if (ec) {
            report.fail(code_for(ec), "mv: cannot move '" + operand + "': " + describe(ec));
            continue;
        }
        report.ok("Moved: " + source.string() + " -> " + target.string());
        if (!new_directory) {
            new_directory = relocate_if_affected(cwd, source, target);
        }
    }
    return report.finish(std::move(new_directory));
}

auto FilesystemNavigator::read_files(std::string const& cwd, std::vector<std::string> const& args) const
    -> Expected<NavigatorResult> {
    auto const flags = parse_flags(args);
    if (flags.operands.empty()) {
        return std::unexpected(missing_operand("cat"));
    }

    Report report;
    for (auto const& operand : flags.operands) {
        auto const path = resolve_path(cwd, operand);
        if (!is_within_sandbox(path)) {
            report.fail(Error::Code::Forbidden, "cat: " + operand + ": Outside of sandbox root");
            continue;
        }
        std::error_code ec;
        auto const      status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            report.fail(Error::Code::NotFound, "cat: " + operand + ": No such file or directory");
            continue;
        }
        if (fs::is_directory(status)) {
            report.fail(Error::Code::InvalidArguments, "cat: " + operand + ": Is a directory");
            continue;
        }
        std::ifstream input{path, std::ios::binary};
        if (!input) {
            report.fail(Error::Code::PermissionDenied, "cat: " + operand + ": Permission denied");
            continue;
        }
        std::string content(config_.max_read_bytes, '\0');
        input.read(content.data(), static_cast<std::streamsize>(content.size()));
        content.resize(static_cast<std::size_t>(input.gcount()));
        bool const truncated = input.peek() != std::ifstream::traits_type::eof();
        while (!content.empty() && content.back() == '\n') {
            content.pop_back();
        }
        if (truncated) {
            content.append("\n[output truncated]");
        }
        report.ok(std::move(content));
    }
    return report.finish();
}

auto FilesystemNavigator::touch(std::string const& cwd, std::vector<std::string> const& args) const
    -> Expected<NavigatorResult> {
    auto const flags = parse_flags(args);
    if (flags.operands.empty()) {
        return std::unexpected(missing_operand("touch", "file operand"));
    }

    Report report;
    for (auto const& operand : flags.operands) {
        auto const path = resolve_path(cwd, operand);
        if (!is_within_sandbox(path)) {
            report.fail(Error::Code::Forbidden, "touch: cannot touch '" + operand + "': Outside of sandbox root");
            continue;
        }
        std::error_code ec;
        if (fs::exists(path, ec)) {
            fs::last_write_time(path, fs::file_time_type::clock::now(), ec);
            if (ec) {
                report.fail(code_for(ec), "touch: cannot touch '" + operand + "': " + describe(ec));
                continue;
            }
            report.ok("Touched file: " + path.string());
            continue;
        }
        if (!fs::is_directory(path.parent_path(), ec)) {
            report.fail(Error::Code::NotFound, "touch: cannot touch '" + operand + "': No such file or directory");
            continue;
        }
        std::ofstream output{path, std::ios::app};
        if (!output) {
            report.fail(Error::Code::PermissionDenied, "touch: cannot touch '" + operand + "': Permission denied");
            continue;
        }
        report.ok("Touched file: " + path.string());
    }
    return report.finish();
}

} // namespace TS::Shell
