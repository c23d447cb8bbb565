#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace appdirs::infra {

/// Read-only view of the variables and home directory a provider consults.
class Environment {
public:
    virtual ~Environment() = default;

    /// Returns the value of an environment variable, or nullopt if unset.
    [[nodiscard]] virtual auto get(std::string_view name) const
        -> std::optional<std::string> = 0;

    /// Returns the user's home directory, or nullopt if it cannot be found.
    /// The default implementation reads HOME and rejects empty values.
    [[nodiscard]] virtual auto home_dir() const -> std::optional<std::filesystem::path>;
};

/// Environment of the running process.
/// Home lookup: HOME, then the passwd entry (POSIX) or USERPROFILE (Windows).
class ProcessEnvironment final : public Environment {
public:
    [[nodiscard]] auto get(std::string_view name) const
        -> std::optional<std::string> override;
    [[nodiscard]] auto home_dir() const -> std::optional<std::filesystem::path> override;
};

/// Fixed set of variables, independent of the process environment.
class MapEnvironment final : public Environment {
public:
    MapEnvironment() = default;
    explicit MapEnvironment(std::unordered_map<std::string, std::string> vars)
        : vars_(std::move(vars)) {}

    void set(std::string name, std::string value);
    void unset(const std::string& name);

    [[nodiscard]] auto get(std::string_view name) const
        -> std::optional<std::string> override;

private:
    std::unordered_map<std::string, std::string> vars_;
};

} // namespace appdirs::infra
