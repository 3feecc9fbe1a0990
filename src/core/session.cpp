#include <sitescan/core/session.hpp>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace sitescan::core {

bool is_terminal(SessionState state) noexcept {
  return state == SessionState::Complete || state == SessionState::Failed;
}

std::string_view to_string(SessionState state) noexcept {
  switch (state) {
    case SessionState::Idle:
      return "IDLE";
    case SessionState::SelectingBackends:
      return "SELECTING_BACKENDS";
    case SessionState::Analyzing:
      return "ANALYZING";
    case SessionState::Fusing:
      return "FUSING";
    case SessionState::Recommending:
      return "RECOMMENDING";
    case SessionState::Complete:
      return "COMPLETE";
    case SessionState::Failed:
      return "FAILED";
  }
  return "UNKNOWN";
}

std::string_view to_string(SubmissionKind kind) noexcept {
  return kind == SubmissionKind::Photo ? "photo" : "frame";
}

std::string_view to_string(RecommendationReason reason) noexcept {
  return reason == RecommendationReason::AutoSelected ? "AUTO_SELECTED" : "SUGGESTED";
}

std::string failure_message(AnalysisError error) {
  switch (error) {
    case AnalysisError::MalformedInput:
      return "Could not analyze this image. Please retake the photo.";
    case AnalysisError::Cancelled:
      return "Analysis was cancelled.";
    case AnalysisError::NoBackendAvailable:
    default:
      return "Analysis is temporarily unavailable. Tag the photo manually.";
  }
}

SessionBuilder::SessionBuilder(std::string correlation_id, SubmissionKind kind) {
  session_.correlation_id_ = std::move(correlation_id);
  session_.kind_ = kind;
  session_.transitions_.push_back(SessionState::Idle);
}

void SessionBuilder::require_open() const {
  if (is_terminal(session_.state_)) {
    throw std::logic_error("session " + session_.correlation_id_ + " is already finalized");
  }
}

void SessionBuilder::advance(SessionState next) {
  require_open();
  if (static_cast<int>(next) <= static_cast<int>(session_.state_)) {
    throw std::logic_error("session state cannot move from " +
                           std::string(to_string(session_.state_)) + " to " +
                           std::string(to_string(next)));
  }
  session_.state_ = next;
  session_.transitions_.push_back(next);
}

void SessionBuilder::set_backend_chain(std::vector<BackendId> chain) {
  require_open();
  session_.backend_chain_ = std::move(chain);
}

void SessionBuilder::add_contributing_backend(const BackendId& id) {
  require_open();
  auto& ids = session_.contributing_backends_;
  if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
    ids.push_back(id);
  }
}

void SessionBuilder::set_degraded_capability(bool degraded) {
  require_open();
  session_.degraded_capability_ = degraded;
}

void SessionBuilder::set_fused_hazards(std::vector<FusedHazard> hazards) {
  require_open();
  session_.fused_hazards_ = std::move(hazards);
}

void SessionBuilder::set_recommendations(std::vector<TagRecommendation> recommendations,
                                         std::set<std::string> auto_select_tags) {
  require_open();
  session_.recommendations_ = std::move(recommendations);
  session_.auto_select_tags_ = std::move(auto_select_tags);
}

AnalysisSession SessionBuilder::complete(std::chrono::milliseconds total_latency) {
  advance(SessionState::Complete);
  session_.total_latency_ = total_latency;
  return session_;
}

AnalysisSession SessionBuilder::fail(AnalysisError error, std::chrono::milliseconds total_latency) {
  advance(SessionState::Failed);
  session_.error_ = error;
  session_.user_message_ = failure_message(error);
  session_.total_latency_ = total_latency;
  // A failed session carries no partial analysis.
  session_.fused_hazards_.clear();
  session_.recommendations_.clear();
  session_.auto_select_tags_.clear();
  return session_;
}

}  // namespace sitescan::core
