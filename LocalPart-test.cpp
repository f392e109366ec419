#include "LocalPart.hpp"

#include <stdexcept>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const simple = LocalPart::parse("simple");
  CHECK(simple);
  CHECK(simple->type() == LocalPart::types::dot_string);
  CHECK_EQ(simple->text(), "simple");
  CHECK_EQ(simple->as_string(), "simple");

  CHECK_EQ(LocalPart::parse("a.b.c")->text(), "a.b.c");
  CHECK_EQ(LocalPart::parse("user+tag")->text(), "user+tag");
  CHECK_EQ(LocalPart::parse("mailhost!username")->text(), "mailhost!username");

  CHECK(!LocalPart::parse(""));
  CHECK(!LocalPart::parse("a..b"));
  CHECK(!LocalPart::parse(".a"));
  CHECK(!LocalPart::parse("a."));
  CHECK(!LocalPart::parse("a b"));
  CHECK(!LocalPart::parse("a@b"));
  CHECK(!LocalPart::parse("just\"not\"right"));
  CHECK(!LocalPart::parse("\xC3\xA9t\xC3\xA9"));

  // Quoted-string text is stored decoded.
  auto const quoted = LocalPart::parse("\"a\\\"b\\\\c\"");
  CHECK(quoted);
  CHECK(quoted->is_quoted());
  CHECK_EQ(quoted->text(), "a\"b\\c");
  CHECK_EQ(quoted->as_string(), "\"a\\\"b\\\\c\"");
  CHECK(LocalPart::parse(quoted->as_string()) == quoted);

  // Escaping other characters is allowed, but not kept.
  auto const needless = LocalPart::parse("\"\\a\\.\\.\\b\"");
  CHECK(needless);
  CHECK_EQ(needless->text(), "a..b");
  CHECK_EQ(needless->as_string(), "\"a..b\"");
  CHECK_EQ(*needless, *LocalPart::parse("\"a..b\""));

  CHECK_EQ(LocalPart::parse("\"\"")->text(), "");
  CHECK_EQ(LocalPart::parse("\" \"")->text(), " ");
  CHECK_EQ(LocalPart::parse("\"a b\"")->as_string(), "\"a b\"");

  CHECK(!LocalPart::parse("\"unterminated"));
  CHECK(!LocalPart::parse("\"escaped end\\\""));
  CHECK(!LocalPart::parse("\"tab\tinside\""));
  CHECK(!LocalPart::parse("\"bare \" quote\""));
  CHECK(!LocalPart::parse("\"a\".b"));

  // A quoted "a" and a plain a are different local parts.
  CHECK_NE(LocalPart{"\"ab\""}, LocalPart{"ab"});

  LocalPart const built{LocalPart::types::quoted_string, "x\"y"};
  CHECK_EQ(built.as_string(), "\"x\\\"y\"");

  auto threw = false;
  try {
    LocalPart bad{"no spaces"};
  }
  catch (std::invalid_argument const& e) {
    threw = true;
  }
  CHECK(threw);
}
