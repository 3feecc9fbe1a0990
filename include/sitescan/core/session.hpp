#pragma once

#include <sitescan/core/compliance_tag.hpp>
#include <sitescan/core/error.hpp>
#include <sitescan/core/hazard.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sitescan::core {

/// Session lifecycle. Declaration order is the only allowed direction of travel;
/// Complete and Failed are terminal.
enum class SessionState : std::uint8_t {
  Idle,
  SelectingBackends,
  Analyzing,
  Fusing,
  Recommending,
  Complete,
  Failed,
};

enum class SubmissionKind : std::uint8_t {
  Photo,  // single-shot capture, never throttled
  Frame,  // streaming live frame
};

[[nodiscard]] bool is_terminal(SessionState state) noexcept;
[[nodiscard]] std::string_view to_string(SessionState state) noexcept;
[[nodiscard]] std::string_view to_string(SubmissionKind kind) noexcept;

/// User-facing text for a failed session ("retake" vs "tag manually").
[[nodiscard]] std::string failure_message(AnalysisError error);

class SessionBuilder;

/// Finalized result of analyzing one image. Only SessionBuilder creates it, and
/// only in a terminal state; there are no mutators.
class AnalysisSession {
 public:
  [[nodiscard]] const std::string& correlation_id() const noexcept { return correlation_id_; }
  [[nodiscard]] SubmissionKind kind() const noexcept { return kind_; }
  [[nodiscard]] SessionState state() const noexcept { return state_; }
  [[nodiscard]] const std::vector<SessionState>& transitions() const noexcept { return transitions_; }

  [[nodiscard]] const std::vector<FusedHazard>& fused_hazards() const noexcept { return fused_hazards_; }
  [[nodiscard]] const std::vector<TagRecommendation>& recommendations() const noexcept {
    return recommendations_;
  }
  [[nodiscard]] const std::set<std::string>& auto_select_tags() const noexcept { return auto_select_tags_; }
  [[nodiscard]] bool degraded_capability() const noexcept { return degraded_capability_; }

  /// Backends in the order selection chose to try them.
  [[nodiscard]] const std::vector<BackendId>& backend_chain() const noexcept { return backend_chain_; }
  /// Backends whose results were fused.
  [[nodiscard]] const std::vector<BackendId>& contributing_backends() const noexcept {
    return contributing_backends_;
  }
  [[nodiscard]] std::chrono::milliseconds total_latency() const noexcept { return total_latency_; }

  [[nodiscard]] const std::optional<AnalysisError>& error() const noexcept { return error_; }
  /// Empty unless Failed.
  [[nodiscard]] const std::string& user_message() const noexcept { return user_message_; }

  [[nodiscard]] bool completed() const noexcept { return state_ == SessionState::Complete; }

 private:
  friend class SessionBuilder;
  AnalysisSession() = default;

  std::string correlation_id_;
  SubmissionKind kind_{SubmissionKind::Photo};
  SessionState state_{SessionState::Idle};
  std::vector<SessionState> transitions_;
  std::vector<FusedHazard> fused_hazards_;
  std::vector<TagRecommendation> recommendations_;
  std::set<std::string> auto_select_tags_;
  bool degraded_capability_{false};
  std::vector<BackendId> backend_chain_;
  std::vector<BackendId> contributing_backends_;
  std::chrono::milliseconds total_latency_{0};
  std::optional<AnalysisError> error_;
  std::string user_message_;
};

/// Accumulates a session while the orchestrator drives it. advance() refuses to
/// move backwards or out of a terminal state; complete()/fail() hand out the
/// finalized session once.
class SessionBuilder {
 public:
  SessionBuilder(std::string correlation_id, SubmissionKind kind);

  [[nodiscard]] SessionState state() const noexcept { return session_.state_; }
  [[nodiscard]] const std::string& correlation_id() const noexcept { return session_.correlation_id_; }

  /// Moves forward to next. Throws std::logic_error on a backward or post-terminal move.
  void advance(SessionState next);

  void set_backend_chain(std::vector<BackendId> chain);
  void add_contributing_backend(const BackendId& id);
  void set_degraded_capability(bool degraded);
  void set_fused_hazards(std::vector<FusedHazard> hazards);
  void set_recommendations(std::vector<TagRecommendation> recommendations,
                           std::set<std::string> auto_select_tags);

  [[nodiscard]] AnalysisSession complete(std::chrono::milliseconds total_latency);
  [[nodiscard]] AnalysisSession fail(AnalysisError error, std::chrono::milliseconds total_latency);

 private:
  void require_open() const;

  AnalysisSession session_;
};

}  // namespace sitescan::core
