#include <labelscan/app/validation_workflow.hpp>
#include <labelscan/core/logging.hpp>
#include <labelscan/text/candidate_selector.hpp>

#include <stdexcept>
#include <utility>

namespace labelscan::app {

namespace {

std::string_view preview(std::string_view text) {
  return text.substr(0, 30);
}

const std::string& prefer(const std::string& server, const std::string& local) {
  return server.empty() ? local : server;
}

}  // namespace

std::string_view to_string(ValidationStatus status) noexcept {
  switch (status) {
    case ValidationStatus::Scanning: return "scanning";
    case ValidationStatus::Validating: return "validating";
    case ValidationStatus::Validated: return "validated";
    case ValidationStatus::Error: return "error";
    default: return "idle";
  }
}

HybridValidator::HybridValidator(std::shared_ptr<IValidationClient> client, ValidationConfig config)
    : client_(std::move(client)),
      config_(config),
      cache_(config.cache_capacity, config.cache_ttl, config.cache_key_max_length) {
  if (!client_) throw std::invalid_argument("HybridValidator requires a validation client");
}

ValidationStatus HybridValidator::show_local(std::string_view raw_text,
                                             const core::ParsedAddress& parsed) {
  if (parsed.confidence < config_.scanning_min_confidence) return state_.status;
  state_.local_parsed = parsed;
  const bool tracked = generation_ > 0 && raw_text == tracked_text_ &&
                       state_.status != ValidationStatus::Idle &&
                       state_.status != ValidationStatus::Scanning;
  if (tracked) return state_.status;

  if (raw_text != tracked_text_) {
    // Different text supersedes any debounce or call pending for the tracked one.
    ++generation_;
    tracked_text_ = std::string(raw_text);
    deadline_.reset();
    error_since_.reset();
    state_.server_result.reset();
  }
  state_.status = ValidationStatus::Scanning;
  state_.raw_text = std::string(raw_text);
  state_.error.clear();
  state_.is_network_error = false;
  return state_.status;
}

ValidationStatus HybridValidator::submit(std::string_view raw_text, const core::ParsedAddress& parsed,
                                         Clock::time_point now) {
  show_local(raw_text, parsed);
  if (parsed.confidence < config_.validation_min_confidence) {
    core::logger()->trace("validation: confidence {:.2f} below threshold, not submitted",
                          parsed.confidence);
    return state_.status;
  }
  state_.local_parsed = parsed;

  if (generation_ > 0 && raw_text == tracked_text_ &&
      (state_.status == ValidationStatus::Validating || state_.status == ValidationStatus::Validated ||
       state_.status == ValidationStatus::Error)) {
    return state_.status;
  }

  // New text supersedes any pending debounce and in-flight call. show_local() has
  // already done so unless the record was below the scanning threshold.
  if (raw_text != tracked_text_) {
    ++generation_;
    tracked_text_ = std::string(raw_text);
  }
  state_.raw_text = tracked_text_;
  state_.server_result.reset();
  state_.error.clear();
  state_.is_network_error = false;
  error_since_.reset();
  deadline_.reset();

  if (auto cached = cache_.get(raw_text, now)) {
    core::logger()->debug("validation: cache hit for \"{}\"", preview(raw_text));
    state_.server_result = std::move(*cached);
    state_.status = ValidationStatus::Validated;
    return state_.status;
  }
  core::logger()->debug("validation: cache miss for \"{}\"", preview(raw_text));

  state_.status = ValidationStatus::Validating;
  deadline_ = now + config_.debounce;
  return state_.status;
}

void HybridValidator::issue_call() {
  ValidationRequest request;
  request.raw_text = tracked_text_;
  if (state_.local_parsed) {
    request.first_name = state_.local_parsed->first_name;
    request.last_name = state_.local_parsed->last_name;
    request.phone = state_.local_parsed->phone_number;
    request.company = state_.local_parsed->company_name;
  }
  core::logger()->info("validation: request (generation {}) for \"{}\"", generation_,
                       preview(tracked_text_));
  calls_.push_back(Call{generation_, tracked_text_, client_->validate(request)});
}

ValidationStatus HybridValidator::poll(Clock::time_point now) {
  if (deadline_ && now >= *deadline_) {
    deadline_.reset();
    try {
      issue_call();
    } catch (const std::exception& e) {
      Call failed{generation_, tracked_text_, {}};
      commit(failed, std::unexpected(ValidationFailure{core::ValidationErrorKind::Network, e.what()}),
             now);
    }
  }

  for (auto it = calls_.begin(); it != calls_.end();) {
    if (!it->future.valid()) {
      it = calls_.erase(it);
      continue;
    }
    if (it->future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
      ++it;
      continue;
    }
    ValidationOutcome outcome;
    try {
      outcome = it->future.get();
    } catch (const std::exception& e) {
      outcome = std::unexpected(ValidationFailure{core::ValidationErrorKind::Network, e.what()});
    }
    if (it->generation != generation_) {
      core::logger()->debug("validation: dropping stale result (generation {}, current {})",
                            it->generation, generation_);
    } else {
      commit(*it, std::move(outcome), now);
    }
    it = calls_.erase(it);
  }
  return state_.status;
}

void HybridValidator::commit(Call& call, ValidationOutcome outcome, Clock::time_point now) {
  if (outcome && outcome->is_valid && outcome->confidence >= config_.min_server_confidence) {
    core::logger()->info("validation: accepted (confidence {:.2f}, source {})", outcome->confidence,
                         outcome->source);
    cache_.put(call.raw_text, *outcome, now);
    state_.server_result = std::move(*outcome);
    state_.status = ValidationStatus::Validated;
    state_.error.clear();
    state_.is_network_error = false;
    error_since_.reset();
    return;
  }

  state_.status = ValidationStatus::Error;
  error_since_ = now;
  if (outcome) {
    state_.error = "address rejected by server";
    state_.is_network_error = false;
    core::logger()->warn("validation: rejected (valid {}, confidence {:.2f})", outcome->is_valid,
                         outcome->confidence);
    return;
  }
  state_.is_network_error = outcome.error().kind == core::ValidationErrorKind::Network;
  state_.error = state_.is_network_error ? "network unreachable" : "validation failed";
  core::logger()->warn("validation: {} ({})", state_.error, outcome.error().message);
}

void HybridValidator::accept_local() {
  if (!state_.local_parsed) return;
  // Freeze the session on the local record; late server answers are dropped.
  ++generation_;
  deadline_.reset();
  error_since_.reset();
  state_.status = ValidationStatus::Validated;
  state_.error.clear();
  state_.is_network_error = false;
  core::logger()->info("validation: local record accepted manually");
}

bool HybridValidator::should_offer_manual_fallback(Clock::time_point now) const noexcept {
  return state_.status == ValidationStatus::Error && error_since_ &&
         now - *error_since_ >= config_.manual_fallback;
}

std::optional<BestAddress> HybridValidator::best_address() const {
  if (state_.server_result && state_.server_result->is_valid) {
    const auto& addr = state_.server_result->address;
    return BestAddress{addr.street,   addr.postal_code, addr.city,
                       addr.latitude, addr.longitude,   true,
                       state_.server_result->confidence};
  }
  if (state_.local_parsed) {
    const auto& local = *state_.local_parsed;
    return BestAddress{local.street, local.postal_code, local.city,
                       std::nullopt, std::nullopt,      false,
                       local.confidence};
  }
  return std::nullopt;
}

std::optional<BestContact> HybridValidator::best_contact() const {
  if (!state_.local_parsed && !(state_.server_result && state_.server_result->contact)) {
    return std::nullopt;
  }
  const core::ParsedAddress local = state_.local_parsed.value_or(core::ParsedAddress{});
  BestContact contact{local.first_name, local.last_name, local.phone_number, local.company_name};
  if (state_.server_result && state_.server_result->contact) {
    const auto& server = *state_.server_result->contact;
    contact.first_name = prefer(server.first_name, local.first_name);
    contact.last_name = prefer(server.last_name, local.last_name);
    contact.phone = prefer(server.phone, local.phone_number);
    contact.company = prefer(server.company, local.company_name);
  }
  return contact;
}

std::optional<core::ParsedAddress> HybridValidator::final_record() const {
  if (!state_.local_parsed) return std::nullopt;
  core::ParsedAddress record = *state_.local_parsed;
  if (const auto address = best_address(); address && address->is_validated) {
    record.street = prefer(address->street, record.street);
    record.postal_code = prefer(address->postal_code, record.postal_code);
    record.city = prefer(address->city, record.city);
    const std::string& formatted = state_.server_result->address.formatted;
    record.full_address = formatted.empty()
                              ? text::assemble_full_address(record.street, record.address_annex,
                                                            record.postal_code, record.city)
                              : formatted;
  }
  if (const auto contact = best_contact()) {
    record.first_name = contact->first_name;
    record.last_name = contact->last_name;
    record.phone_number = contact->phone;
    record.company_name = contact->company;
    record.is_company = !record.company_name.empty();
  }
  return record;
}

void HybridValidator::reset() {
  ++generation_;
  tracked_text_.clear();
  deadline_.reset();
  error_since_.reset();
  state_ = ValidationState{};
}

}  // namespace labelscan::app
