#pragma once
/*
================================================================================
Sizing: Conductor Selector
FILE: cpp/engine/sizing/conductor_selector.hpp

Decision algorithm:
  1. derating = compose_derating(...)             (LookupError propagates)
  2. walk the standard's size list smallest -> largest:
       resolve base ampacity + resistance, derate, compute voltage drop;
       stop at the first size with
         derated >= current   AND   percent <= limit
     A LookupError for one candidate (e.g. no aluminum row for that size)
     skips it; the search continues with the next size.
  3. no size satisfies both: return the largest size that resolved, with
     compliance.fully = false and a SEARCH.EXHAUSTED warning. If no size
     resolved at all the request fails with LookupError.

  With input.explicit_size set, only that size is evaluated and reported.

Properties:
  - Total function of (input, settings). No hidden state; safe to call
    concurrently and to memoize (see sizing_cache.hpp).
  - Never prefers a size satisfying only one constraint.
================================================================================
*/

#include <optional>
#include <string>

#include "engine/core/errors.hpp"
#include "engine/core/settings.hpp"
#include "engine/sizing/sizing_types.hpp"

namespace cable {

// Throws LookupError (table membership) or ValidationError (length unit /
// settings). Non-compliance is a normal result, never an exception.
CableSizingResult select_conductor(const CableSizingInput& input,
                                   const EngineSettings& settings = EngineSettings::defaults());

// Evaluates a single size against both constraints (LookupError if the size
// does not resolve for the input's material and rating).
CandidateEvaluation evaluate_candidate(const CableSizingInput& input,
                                       const DeratingFactor& derating,
                                       ConductorSize size,
                                       const EngineSettings& settings);

// Boundary form: LookupError and ValidationError become an outcome.
struct SelectionOutcome {
  std::optional<CableSizingResult> result{};
  ErrorCode code = ErrorCode::kOk;
  std::string message;

  bool ok() const noexcept { return result.has_value(); }
};

SelectionOutcome try_select_conductor(const CableSizingInput& input,
                                      const EngineSettings& settings = EngineSettings::defaults());

} // namespace cable
