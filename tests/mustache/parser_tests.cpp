#include <string>

#include "doctest/doctest.h"

#include "whisker/mustache/lexer.hpp"
#include "whisker/mustache/parser/detail.hpp"
#include "whisker/mustache/parser/sm.hpp"

namespace {

bool parse_template(const std::string & text, whisker::mustache::program & program) {
  whisker::mustache::lexer lex;
  const whisker::mustache::lexer_result lex_res = lex.tokenize(text);
  REQUIRE(lex_res.error == WHISKER_OK);
  whisker::mustache::parser::detail::template_parser parser{program};
  return parser.parse(lex_res);
}

const whisker::mustache::text_node * as_text(const whisker::mustache::ast_ptr & node) {
  return dynamic_cast<const whisker::mustache::text_node *>(node.get());
}

const whisker::mustache::section_node * as_section(const whisker::mustache::ast_ptr & node) {
  return dynamic_cast<const whisker::mustache::section_node *>(node.get());
}

}  // namespace

TEST_CASE("mustache_parser_builds_text_and_variable_nodes") {
  whisker::mustache::program program{};
  REQUIRE(parse_template("Hello {{name}} and {{{raw}}}", program));
  REQUIRE(program.body.size() == 4);

  REQUIRE(as_text(program.body[0]) != nullptr);
  CHECK(as_text(program.body[0])->text == "Hello ");

  const auto * escaped =
    dynamic_cast<const whisker::mustache::variable_node *>(program.body[1].get());
  REQUIRE(escaped != nullptr);
  CHECK(escaped->name == "name");
  CHECK(escaped->escaped);
  CHECK(escaped->pos == 6);

  const auto * raw =
    dynamic_cast<const whisker::mustache::variable_node *>(program.body[3].get());
  REQUIRE(raw != nullptr);
  CHECK(raw->name == "raw");
  CHECK_FALSE(raw->escaped);
}

TEST_CASE("mustache_parser_nests_sections_and_keeps_raw_text") {
  whisker::mustache::program program{};
  REQUIRE(parse_template("{{#a}}Hi {{name}}.{{^b}}none{{/b}}{{/a}}", program));
  REQUIRE(program.body.size() == 1);

  const auto * outer = as_section(program.body[0]);
  REQUIRE(outer != nullptr);
  CHECK(outer->name == "a");
  CHECK_FALSE(outer->inverted);
  CHECK(outer->raw == "Hi {{name}}.{{^b}}none{{/b}}");
  REQUIRE(outer->children.size() == 4);

  const auto * inner = as_section(outer->children[3]);
  REQUIRE(inner != nullptr);
  CHECK(inner->inverted);
  CHECK(inner->raw == "none");
}

TEST_CASE("mustache_parser_trims_standalone_section_lines") {
  whisker::mustache::program program{};
  REQUIRE(parse_template("begin\n{{#a}}\nline\n{{/a}}\nend\n", program));
  REQUIRE(program.body.size() == 3);

  CHECK(as_text(program.body[0])->text == "begin\n");
  const auto * section = as_section(program.body[1]);
  REQUIRE(section != nullptr);
  REQUIRE(section->children.size() == 1);
  CHECK(as_text(section->children[0])->text == "line\n");
  CHECK(section->raw == "\nline\n");
  CHECK(as_text(program.body[2])->text == "end\n");
}

TEST_CASE("mustache_parser_trims_indented_standalone_tags") {
  whisker::mustache::program program{};
  REQUIRE(parse_template("  {{#a}}\n  x\n  {{/a}}\n", program));
  REQUIRE(program.body.size() == 1);

  const auto * section = as_section(program.body[0]);
  REQUIRE(section != nullptr);
  REQUIRE(section->children.size() == 1);
  CHECK(as_text(section->children[0])->text == "  x\n");
}

TEST_CASE("mustache_parser_keeps_inline_tags_untrimmed") {
  whisker::mustache::program program{};
  REQUIRE(parse_template("a {{#s}}x{{/s}} b\n", program));
  REQUIRE(program.body.size() == 3);
  CHECK(as_text(program.body[0])->text == "a ");
  CHECK(as_text(program.body[2])->text == " b\n");
}

TEST_CASE("mustache_parser_elides_standalone_comments") {
  whisker::mustache::program program{};
  REQUIRE(parse_template("a\n  {{! note }}\nb", program));
  REQUIRE(program.body.size() == 2);
  CHECK(as_text(program.body[0])->text == "a\n");
  CHECK(as_text(program.body[1])->text == "b");
}

TEST_CASE("mustache_parser_standalone_at_end_of_input") {
  whisker::mustache::program program{};
  REQUIRE(parse_template("a\n{{! tail }}", program));
  REQUIRE(program.body.size() == 1);
  CHECK(as_text(program.body[0])->text == "a\n");
}

TEST_CASE("mustache_parser_trims_crlf_standalone_lines") {
  whisker::mustache::program program{};
  REQUIRE(parse_template("|\r\n{{#boolean}}\r\n{{/boolean}}\r\n|", program));
  REQUIRE(program.body.size() == 3);
  CHECK(as_text(program.body[0])->text == "|\r\n");
  const auto * section = as_section(program.body[1]);
  REQUIRE(section != nullptr);
  CHECK(section->children.empty());
  CHECK(as_text(program.body[2])->text == "|");

  whisker::mustache::program comment{};
  REQUIRE(parse_template("a\r\n  {{! c }}\r\nb", comment));
  REQUIRE(comment.body.size() == 2);
  CHECK(as_text(comment.body[0])->text == "a\r\n");
  CHECK(as_text(comment.body[1])->text == "b");
}

TEST_CASE("mustache_parser_captures_standalone_partial_indent") {
  whisker::mustache::program program{};
  REQUIRE(parse_template("  {{>item}}\n>{{>inline}}", program));
  REQUIRE(program.body.size() == 3);

  const auto * standalone =
    dynamic_cast<const whisker::mustache::partial_node *>(program.body[0].get());
  REQUIRE(standalone != nullptr);
  CHECK(standalone->name == "item");
  CHECK(standalone->indent == "  ");

  CHECK(as_text(program.body[1])->text == ">");

  const auto * inline_partial =
    dynamic_cast<const whisker::mustache::partial_node *>(program.body[2].get());
  REQUIRE(inline_partial != nullptr);
  CHECK(inline_partial->indent.empty());
}

TEST_CASE("mustache_parser_records_section_delimiters") {
  whisker::mustache::program program{};
  REQUIRE(parse_template("{{=<% %>=}}<%#a%>x<%/a%>", program));
  REQUIRE(program.body.size() == 1);

  const auto * section = as_section(program.body[0]);
  REQUIRE(section != nullptr);
  CHECK(section->delims.open == "<%");
  CHECK(section->delims.close == "%>");
  CHECK(section->raw == "x");
}

TEST_CASE("mustache_parser_reports_unmatched_section_end") {
  whisker::mustache::program program{};
  CHECK_FALSE(parse_template("ok {{/a}}", program));
  CHECK(program.last_error == WHISKER_ERR_PARSE_FAILED);
  CHECK(program.last_error_domain == WHISKER_ERROR_DOMAIN_PARSER);
  CHECK(program.last_error_reason == WHISKER_REASON_UNMATCHED_SECTION_END);
  CHECK(program.last_error_pos == 3);
  CHECK(program.body.empty());
}

TEST_CASE("mustache_parser_reports_section_mismatch") {
  whisker::mustache::program program{};
  CHECK_FALSE(parse_template("{{#a}}{{/b}}", program));
  CHECK(program.last_error_reason == WHISKER_REASON_SECTION_MISMATCH);
  CHECK(program.last_error_pos == 6);
}

TEST_CASE("mustache_parser_reports_unclosed_section") {
  whisker::mustache::program program{};
  CHECK_FALSE(parse_template("x{{#a}}y", program));
  CHECK(program.last_error_reason == WHISKER_REASON_UNCLOSED_SECTION);
  CHECK(program.last_error_pos == 1);
}

TEST_CASE("mustache_parser_sm_parses_and_dispatches_done") {
  whisker::mustache::program program{};
  int32_t err = WHISKER_ERR_BACKEND;
  whisker_error_detail detail{};
  size_t nodes = 0;

  auto on_done = [&](const whisker::mustache::events::parsing_done & done) {
    nodes = done.node_count;
    return true;
  };

  whisker::mustache::parser::action::context ctx{};
  whisker::mustache::parser::sm machine{ctx};
  CHECK(machine.process_event(whisker::mustache::event::parse{
    .template_text = "a{{b}}c",
    .program_out = &program,
    .error_out = &err,
    .error_detail_out = &detail,
    .dispatch_done =
      ::whisker::callback<bool(const whisker::mustache::events::parsing_done &)>::bind(on_done),
  }));
  CHECK(err == WHISKER_OK);
  CHECK(detail.status == WHISKER_OK);
  CHECK(program.body.size() == 3);
  CHECK(nodes == 3);
  CHECK(machine.is(boost::sml::state<whisker::mustache::parser::done>));
}

TEST_CASE("mustache_parser_sm_accepts_empty_template") {
  whisker::mustache::program program{};
  int32_t err = WHISKER_ERR_BACKEND;

  whisker::mustache::parser::action::context ctx{};
  whisker::mustache::parser::sm machine{ctx};
  CHECK(machine.process_event(whisker::mustache::event::parse{
    .template_text = "",
    .program_out = &program,
    .error_out = &err,
  }));
  CHECK(err == WHISKER_OK);
  CHECK(program.body.empty());
}

TEST_CASE("mustache_parser_sm_reports_lexer_errors") {
  whisker::mustache::program program{};
  int32_t err = WHISKER_OK;
  whisker_error_detail detail{};
  int32_t dispatched = WHISKER_OK;

  auto on_error = [&](const whisker::mustache::events::parsing_error & failure) {
    dispatched = failure.err;
    return true;
  };

  whisker::mustache::parser::action::context ctx{};
  whisker::mustache::parser::sm machine{ctx};
  CHECK_FALSE(machine.process_event(whisker::mustache::event::parse{
    .template_text = "ab {{oops",
    .program_out = &program,
    .error_out = &err,
    .error_detail_out = &detail,
    .dispatch_error =
      ::whisker::callback<bool(const whisker::mustache::events::parsing_error &)>::bind(on_error),
  }));
  CHECK(err == WHISKER_ERR_PARSE_FAILED);
  CHECK(dispatched == WHISKER_ERR_PARSE_FAILED);
  CHECK(detail.domain == WHISKER_ERROR_DOMAIN_LEXER);
  CHECK(detail.reason == WHISKER_REASON_UNCLOSED_TAG);
  CHECK(detail.pos == 3);
  CHECK(machine.is(boost::sml::state<whisker::mustache::parser::errored>));
}

TEST_CASE("mustache_parser_sm_honours_initial_delimiters") {
  whisker::mustache::program program{};
  int32_t err = WHISKER_OK;
  const whisker::mustache::delimiters angle{"<%", "%>"};

  whisker::mustache::parser::action::context ctx{};
  whisker::mustache::parser::sm machine{ctx};
  CHECK(machine.process_event(whisker::mustache::event::parse{
    .template_text = "<%#a%>{{x}}<%/a%>",
    .delimiters = &angle,
    .program_out = &program,
    .error_out = &err,
  }));
  REQUIRE(program.body.size() == 1);
  const auto * section = as_section(program.body[0]);
  REQUIRE(section != nullptr);
  REQUIRE(section->children.size() == 1);
  CHECK(as_text(section->children[0])->text == "{{x}}");
}

TEST_CASE("mustache_parser_sm_rejects_invalid_requests") {
  int32_t err = WHISKER_OK;

  whisker::mustache::parser::action::context ctx{};
  whisker::mustache::parser::sm machine{ctx};
  CHECK_FALSE(machine.process_event(whisker::mustache::event::parse{
    .template_text = "{{a}}",
    .program_out = nullptr,
    .error_out = &err,
  }));
  CHECK(err == WHISKER_ERR_INVALID_ARGUMENT);
  CHECK(machine.is(boost::sml::state<whisker::mustache::parser::errored>));

  whisker::mustache::program program{};
  CHECK(machine.process_event(whisker::mustache::event::parse{
    .template_text = "{{a}}",
    .program_out = &program,
    .error_out = &err,
  }));
  CHECK(err == WHISKER_OK);
  CHECK(machine.is(boost::sml::state<whisker::mustache::parser::done>));
}
