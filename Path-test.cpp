#include "Path.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  // Forward-path

  auto const pm = Path::parse("<postmaster>");
  CHECK(pm);
  CHECK(pm->is_postmaster());
  CHECK_EQ(pm->as_string(), "<postmaster>");
  CHECK_EQ(*Path::parse("<Postmaster>"), *pm);
  CHECK_EQ(*Path::parse("<POSTMASTER>"), *pm);
  CHECK_EQ(*pm, Path{Path::PostMaster{}});

  auto const pm_dom = Path::parse("<postmaster@example.org>");
  CHECK(pm_dom);
  CHECK(!pm_dom->is_postmaster());
  CHECK_EQ(std::get<Mailbox>(pm_dom->value()).local_part().text(),
           "postmaster");

  auto const path = Path::parse("<a@example.org>");
  CHECK(path);
  CHECK(!path->is_postmaster());
  CHECK_EQ(*path, Path{Mailbox{"a@example.org"}});
  CHECK_EQ(path->as_string(), "<a@example.org>");

  // The source route is matched and dropped.
  auto const routed
      = Path::parse("<@relay1.example,@relay2.example:a@example.org>");
  CHECK(routed);
  CHECK_EQ(*routed, *path);
  CHECK_EQ(routed->as_string(), "<a@example.org>");

  CHECK(!Path::parse("<@relay.example a@example.org>"));
  CHECK(!Path::parse("<@relay.example:>"));
  CHECK(!Path::parse("<@-relay.example:a@example.org>"));
  CHECK(!Path::parse("<>"));
  CHECK(!Path::parse("a@example.org"));
  CHECK(!Path::parse("<a@example.org"));
  CHECK(!Path::parse("a@example.org>"));
  CHECK(!Path::parse("<postmaster"));
  CHECK(!Path::parse("<postmaster>x"));
  CHECK(!Path::parse("< a@example.org>"));
  CHECK(!Path::parse(""));

  // Reverse-path

  auto const null = ReversePath::parse("<>");
  CHECK(null);
  CHECK(null->is_null());
  CHECK_EQ(null->as_string(), "<>");
  CHECK_EQ(*null, ReversePath{ReversePath::Null{}});

  auto const rev = ReversePath::parse("<a@example.org>");
  CHECK(rev);
  CHECK(!rev->is_null());
  CHECK_EQ(std::get<Mailbox>(rev->value()), Mailbox{"a@example.org"});
  CHECK_EQ(rev->as_string(), "<a@example.org>");

  CHECK(ReversePath::parse("<@relay.example:a@[192.0.2.1]>"));

  CHECK(!ReversePath::parse("<postmaster>"));
  CHECK(!ReversePath::parse("< >"));
  CHECK(!ReversePath::parse("<><>"));
  CHECK(!ReversePath::parse(""));
}
