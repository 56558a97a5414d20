#include <string>

#include "doctest/doctest.h"

#include "whisker/mustache/lexer.hpp"

namespace {

using whisker::mustache::token_type;

}  // namespace

TEST_CASE("mustache_lexer_splits_text_and_variables") {
  whisker::mustache::lexer lex;
  const auto res = lex.tokenize("Hello {{name}}!");
  REQUIRE(res.error == WHISKER_OK);
  REQUIRE(res.tokens.size() == 3);

  CHECK(res.tokens[0].type == token_type::text);
  CHECK(res.tokens[0].value == "Hello ");
  CHECK(res.tokens[0].start == 0);
  CHECK(res.tokens[0].end == 6);

  CHECK(res.tokens[1].type == token_type::variable);
  CHECK(res.tokens[1].value == "name");
  CHECK(res.tokens[1].start == 6);
  CHECK(res.tokens[1].end == 14);

  CHECK(res.tokens[2].type == token_type::text);
  CHECK(res.tokens[2].value == "!");
  CHECK(res.final_delims.is_default());
}

TEST_CASE("mustache_lexer_classifies_sigils") {
  whisker::mustache::lexer lex;
  const auto res =
    lex.tokenize("{{!note}}{{#a}}{{^b}}{{/a}}{{>p}}{{&x}}{{{y}}}{{ z }}{{=<% %>=}}");
  REQUIRE(res.error == WHISKER_OK);
  REQUIRE(res.tokens.size() == 9);

  CHECK(res.tokens[0].type == token_type::comment);
  CHECK(res.tokens[1].type == token_type::section_start);
  CHECK(res.tokens[1].value == "a");
  CHECK(res.tokens[2].type == token_type::inverted_section_start);
  CHECK(res.tokens[2].value == "b");
  CHECK(res.tokens[3].type == token_type::section_end);
  CHECK(res.tokens[3].value == "a");
  CHECK(res.tokens[4].type == token_type::partial);
  CHECK(res.tokens[4].value == "p");
  CHECK(res.tokens[5].type == token_type::unescaped_variable);
  CHECK(res.tokens[5].value == "x");
  CHECK(res.tokens[6].type == token_type::unescaped_variable);
  CHECK(res.tokens[6].value == "y");
  CHECK(res.tokens[7].type == token_type::variable);
  CHECK(res.tokens[7].value == "z");
  CHECK(res.tokens[8].type == token_type::set_delimiters);
  CHECK(res.tokens[8].delims.open == "<%");
  CHECK(res.tokens[8].delims.close == "%>");
}

TEST_CASE("mustache_lexer_trims_tag_names") {
  whisker::mustache::lexer lex;
  const auto res = lex.tokenize("{{# list }}{{/ list }}{{> item }}");
  REQUIRE(res.error == WHISKER_OK);
  REQUIRE(res.tokens.size() == 3);
  CHECK(res.tokens[0].value == "list");
  CHECK(res.tokens[1].value == "list");
  CHECK(res.tokens[2].value == "item");
}

TEST_CASE("mustache_lexer_skips_empty_tags") {
  whisker::mustache::lexer lex;
  const auto res = lex.tokenize("a{{ }}b");
  REQUIRE(res.error == WHISKER_OK);
  REQUIRE(res.tokens.size() == 2);
  CHECK(res.tokens[0].value == "a");
  CHECK(res.tokens[1].value == "b");
  CHECK(res.tokens[1].start == 6);
}

TEST_CASE("mustache_lexer_switches_delimiters_mid_stream") {
  whisker::mustache::lexer lex;
  const auto res = lex.tokenize("{{=<% %>=}}<% name %> {{name}}");
  REQUIRE(res.error == WHISKER_OK);
  REQUIRE(res.tokens.size() == 3);

  CHECK(res.tokens[0].type == token_type::set_delimiters);
  CHECK(res.tokens[0].end == 11);
  CHECK(res.tokens[1].type == token_type::variable);
  CHECK(res.tokens[1].value == "name");
  CHECK(res.tokens[1].start == 11);
  CHECK(res.tokens[1].end == 21);
  CHECK(res.tokens[2].type == token_type::text);
  CHECK(res.tokens[2].value == " {{name}}");

  CHECK_FALSE(res.final_delims.is_default());
  CHECK(res.final_delims.open == "<%");
  CHECK(res.final_delims.close == "%>");
}

TEST_CASE("mustache_lexer_triple_form_only_under_default_pair") {
  whisker::mustache::lexer lex;

  const auto braces = lex.tokenize("{{=<% %>=}}<%{x}%>{{{y}}}");
  REQUIRE(braces.error == WHISKER_OK);
  REQUIRE(braces.tokens.size() == 3);
  CHECK(braces.tokens[1].type == token_type::unescaped_variable);
  CHECK(braces.tokens[1].value == "x");
  CHECK(braces.tokens[2].type == token_type::text);
  CHECK(braces.tokens[2].value == "{{{y}}}");
}

TEST_CASE("mustache_lexer_accepts_initial_delimiters") {
  whisker::mustache::lexer lex;
  const auto res = lex.tokenize("[[a]] {{b}}", whisker::mustache::delimiters{"[[", "]]"});
  REQUIRE(res.error == WHISKER_OK);
  REQUIRE(res.tokens.size() == 2);
  CHECK(res.tokens[0].type == token_type::variable);
  CHECK(res.tokens[0].value == "a");
  CHECK(res.tokens[1].value == " {{b}}");
}

TEST_CASE("mustache_lexer_reports_unclosed_tag") {
  whisker::mustache::lexer lex;
  const auto res = lex.tokenize("abc {{name");
  CHECK(res.error == WHISKER_ERR_PARSE_FAILED);
  CHECK(res.error_reason == WHISKER_REASON_UNCLOSED_TAG);
  CHECK(res.error_pos == 4);
}

TEST_CASE("mustache_lexer_reports_unclosed_triple") {
  whisker::mustache::lexer lex;
  const auto res = lex.tokenize("x {{{name}}");
  CHECK(res.error == WHISKER_ERR_PARSE_FAILED);
  CHECK(res.error_reason == WHISKER_REASON_UNCLOSED_TRIPLE);
  CHECK(res.error_pos == 2);
}

TEST_CASE("mustache_lexer_rejects_malformed_set_delimiters") {
  whisker::mustache::lexer lex;

  const auto one = lex.tokenize("{{=<%=}}");
  CHECK(one.error == WHISKER_ERR_PARSE_FAILED);
  CHECK(one.error_reason == WHISKER_REASON_BAD_DELIMITERS);
  CHECK(one.error_pos == 0);

  const auto three = lex.tokenize("ab{{=< % >=}}");
  CHECK(three.error == WHISKER_ERR_PARSE_FAILED);
  CHECK(three.error_reason == WHISKER_REASON_BAD_DELIMITERS);
  CHECK(three.error_pos == 2);
}

TEST_CASE("mustache_lexer_rejects_empty_delimiters") {
  whisker::mustache::lexer lex;
  const auto res = lex.tokenize("{{a}}", whisker::mustache::delimiters{"", "}}"});
  CHECK(res.error == WHISKER_ERR_PARSE_FAILED);
  CHECK(res.error_reason == WHISKER_REASON_BAD_DELIMITERS);
  CHECK(res.tokens.empty());
}

TEST_CASE("mustache_lexer_handles_empty_source") {
  whisker::mustache::lexer lex;
  const auto res = lex.tokenize("");
  CHECK(res.error == WHISKER_OK);
  CHECK(res.tokens.empty());
}
