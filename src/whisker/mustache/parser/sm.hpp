#pragma once

#include "whisker/mustache/parser/actions.hpp"
#include "whisker/mustache/parser/events.hpp"
#include "whisker/mustache/parser/guards.hpp"
#include "whisker/sm.hpp"

namespace whisker::mustache::parser {

struct initialized {};
struct parse_decision {};
struct done {};
struct errored {};
struct unexpected {};

/**
 * Turns template text into a `program` in a single step.
 *
 * A well-formed `event::parse` is accepted from any resting state
 * (`initialized`, `done`, `errored`, `unexpected`); `run_parse` lexes and
 * builds the tree, and `parse_decision` settles on `done` or `errored` from
 * the error the action recorded. A request without a program or error slot,
 * or with an empty delimiter, goes straight to `errored` (or stays in
 * `unexpected`). Any other event lands in `unexpected` with
 * `WHISKER_ERR_BACKEND` recorded on the context.
 */
struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    const auto parse = sml::event<event::parse>;
    const auto ok = guard::valid_parse{};
    const auto rejected = guard::invalid_parse{};

    return sml::make_transition_table(
        *sml::state<initialized> + parse[ok] / action::run_parse = sml::state<parse_decision>,
        sml::state<done> + parse[ok] / action::run_parse = sml::state<parse_decision>,
        sml::state<errored> + parse[ok] / action::run_parse = sml::state<parse_decision>,
        sml::state<unexpected> + parse[ok] / action::run_parse = sml::state<parse_decision>,

        sml::state<initialized> + parse[rejected] / action::reject_invalid_parse =
            sml::state<errored>,
        sml::state<done> + parse[rejected] / action::reject_invalid_parse = sml::state<errored>,
        sml::state<errored> + parse[rejected] / action::reject_invalid_parse =
            sml::state<errored>,
        sml::state<unexpected> + parse[rejected] / action::reject_invalid_parse =
            sml::state<unexpected>,

        sml::state<parse_decision>[guard::phase_ok{}] = sml::state<done>,
        sml::state<parse_decision>[guard::phase_failed{}] = sml::state<errored>,

        sml::state<initialized> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<parse_decision> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<done> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<errored> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<unexpected> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>);
  }
};

struct sm : public whisker::sm<model> {
  using base_type = whisker::sm<model>;
  using base_type::base_type;
  using base_type::process_event;
};

}  // namespace whisker::mustache::parser
