#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace agro {

// Failure taxonomy of a mission build. Every failure aborts the whole build;
// there is no partial Mission and nothing is retried internally.
enum class FailureKind {
  kInputValidation,    // degenerate / self-intersecting geometry, bad profile
  kCoveragePlanning,   // planner cannot cover the field
  kCapacityExceeded,   // one swath needs more mix than the tank holds
  kTransitUnreachable, // no runway <-> swath path avoiding the NFZ
};

const char* ToString(FailureKind kind);

class MissionBuildError : public std::runtime_error {
public:
  MissionBuildError(FailureKind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}

  FailureKind kind() const noexcept { return kind_; }

  // Log trail up to and including the failure line; filled by Pipeline::Build.
  const std::vector<std::string>& logs() const noexcept { return logs_; }
  void set_logs(std::vector<std::string> logs) { logs_ = std::move(logs); }

private:
  FailureKind kind_;
  std::vector<std::string> logs_;
};

class InputValidationError final : public MissionBuildError {
public:
  explicit InputValidationError(const std::string& what)
      : MissionBuildError(FailureKind::kInputValidation, what) {}
};

class CoveragePlanningFailure final : public MissionBuildError {
public:
  explicit CoveragePlanningFailure(const std::string& what)
      : MissionBuildError(FailureKind::kCoveragePlanning, what) {}
};

class CapacityExceeded final : public MissionBuildError {
public:
  explicit CapacityExceeded(const std::string& what)
      : MissionBuildError(FailureKind::kCapacityExceeded, what) {}
};

class TransitUnreachable final : public MissionBuildError {
public:
  explicit TransitUnreachable(const std::string& what)
      : MissionBuildError(FailureKind::kTransitUnreachable, what) {}
};

} // namespace agro
