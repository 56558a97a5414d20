#pragma once

#include <cstdint>

#include "whisker/mustache/renderer/actions.hpp"
#include "whisker/mustache/renderer/events.hpp"
#include "whisker/mustache/renderer/guards.hpp"
#include "whisker/sm.hpp"

namespace whisker::mustache::renderer {

struct initialized {};
struct setup {};
struct eval_node {};
struct render_decision {};
struct done {};
struct errored {};
struct unexpected {};

/**
 * mustache renderer orchestration model.
 *
 * state purposes:
 * - `initialized`: idle state awaiting render intent.
 * - `setup`: bind the request and seed the root scope frame.
 * - `eval_node`: render one top-level node per step; sections, partials and
 *   lambdas recurse inside the step.
 * - `render_decision`: branch based on phase results.
 * - `done`/`errored`: terminal outcomes.
 * - `unexpected`: sequencing contract violation.
 *
 * guard semantics:
 * - `valid_render`/`invalid_render` validate program and output slots.
 * - `has_node_work`/`no_node_work` track the top-level node cursor.
 * - `phase_*` guards observe errors set by actions.
 *
 * action side effects:
 * - `begin_render`/`seed_scope` prepare context for a render pass.
 * - `eval_next_node` writes output for the next node.
 * - `finalize_*` publish output metadata and dispatch completion callbacks.
 * - `reject_invalid_render` writes errors for invalid requests.
 * - `on_unexpected` reports sequencing violations.
 */
struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
        *sml::state<initialized> +
            sml::event<event::render>[guard::valid_render] / action::begin_render =
                sml::state<setup>,
        sml::state<initialized> +
            sml::event<event::render>[guard::invalid_render] /
                action::reject_invalid_render = sml::state<errored>,

        sml::state<done> + sml::event<event::render>[guard::valid_render] /
                               action::begin_render = sml::state<setup>,
        sml::state<done> + sml::event<event::render>[guard::invalid_render] /
                               action::reject_invalid_render =
            sml::state<errored>,

        sml::state<errored> + sml::event<event::render>[guard::valid_render] /
                                  action::begin_render = sml::state<setup>,
        sml::state<errored> + sml::event<event::render>[guard::invalid_render] /
                                  action::reject_invalid_render =
            sml::state<errored>,

        sml::state<unexpected> +
            sml::event<event::render>[guard::valid_render] / action::begin_render =
                sml::state<setup>,
        sml::state<unexpected> +
            sml::event<event::render>[guard::invalid_render] /
                action::reject_invalid_render = sml::state<unexpected>,

        sml::state<setup> / action::seed_scope = sml::state<eval_node>,

        sml::state<eval_node>[guard::phase_failed{}] = sml::state<render_decision>,
        sml::state<eval_node>[guard::has_node_work{}] / action::eval_next_node =
            sml::state<eval_node>,
        sml::state<eval_node>[guard::no_node_work{}] = sml::state<render_decision>,

        sml::state<render_decision>[guard::phase_ok{}] / action::finalize_done =
            sml::state<done>,
        sml::state<render_decision>[guard::phase_failed{}] / action::finalize_error =
            sml::state<errored>,

        sml::state<initialized> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<setup> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<eval_node> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<render_decision> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<done> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<errored> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>,
        sml::state<unexpected> + sml::unexpected_event<sml::_> /
            action::on_unexpected = sml::state<unexpected>);
  }
};

struct sm : public whisker::sm<model> {
  using base_type = whisker::sm<model>;
  using base_type::base_type;
  using base_type::process_event;
};

}  // namespace whisker::mustache::renderer
