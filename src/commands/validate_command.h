// =============================================================================
// railmr - Validate Command
// =============================================================================
// Checks a manifest and a pipeline definition without running anything.
// Every problem found is reported, not just the first.
// =============================================================================

#ifndef RAILMR_COMMANDS_VALIDATE_COMMAND_H
#define RAILMR_COMMANDS_VALIDATE_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "railmr/common/types.h"

namespace railmr::commands {

struct ValidateOptions {
    /// @brief Manifest to check; empty checks the pipeline alone.
    std::filesystem::path manifestPath;

    std::string pipeline = "dedup-count";
    std::vector<std::string> params;
    std::uint32_t taskCount = kDefaultTaskCount;

    /// @brief Also require local input files to exist.
    bool checkInputs = false;
};

class ValidateCommand {
public:
    explicit ValidateCommand(ValidateOptions options);

    ~ValidateCommand();

    ValidateCommand(const ValidateCommand&) = delete;
    ValidateCommand& operator=(const ValidateCommand&) = delete;
    ValidateCommand(ValidateCommand&&) noexcept;
    ValidateCommand& operator=(ValidateCommand&&) noexcept;

    /// @return 0 if everything is valid, 1 otherwise.
    [[nodiscard]] int execute();

    /// @brief Problems found by the last execute().
    [[nodiscard]] const std::vector<std::string>& problems() const noexcept { return problems_; }

    [[nodiscard]] const ValidateOptions& options() const noexcept { return options_; }

private:
    ValidateOptions options_;
    std::vector<std::string> problems_;
};

[[nodiscard]] std::unique_ptr<ValidateCommand> createValidateCommand(ValidateOptions options);

}  // namespace railmr::commands

#endif  // RAILMR_COMMANDS_VALIDATE_COMMAND_H
