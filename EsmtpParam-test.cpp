#include "EsmtpParam.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const params = esmtp_params_parse("SIZE=1000 BODY=8BITMIME");
  CHECK(params);
  CHECK_EQ(params->size(), 2u);
  CHECK_EQ(params->at(0), (EsmtpParam{"SIZE", "1000"}));
  CHECK_EQ(params->at(1), (EsmtpParam{"BODY", "8BITMIME"}));

  CHECK_EQ(params->at(0).as_string(), "SIZE=1000");

  auto const empty = esmtp_params_parse("");
  CHECK(empty);
  CHECK(empty->empty());

  auto const bare = esmtp_params_parse("SMTPUTF8");
  CHECK(bare);
  CHECK_EQ(bare->size(), 1u);
  CHECK_EQ(bare->at(0).name, "SMTPUTF8");
  CHECK(!bare->at(0).value);
  CHECK_EQ(bare->at(0).as_string(), "SMTPUTF8");

  // Any run of spaces and tabs separates parameters.
  auto const spaced = esmtp_params_parse("A=1  B=2\tC");
  CHECK(spaced);
  CHECK_EQ(spaced->size(), 3u);
  CHECK_EQ(spaced->at(2), (EsmtpParam{"C", std::nullopt}));

  // Duplicates are kept, in order; case is kept too.
  auto const dups = esmtp_params_parse("size=1 SIZE=2");
  CHECK(dups);
  CHECK_EQ(dups->size(), 2u);
  CHECK_EQ(dups->at(0), (EsmtpParam{"size", "1"}));
  CHECK_EQ(dups->at(1), (EsmtpParam{"SIZE", "2"}));

  auto const punct = esmtp_params_parse("ENVID=<abc+2Bx@y> ORCPT=rfc822;a@b.c");
  CHECK(punct);
  CHECK_EQ(punct->at(0).value.value(), "<abc+2Bx@y>");
  CHECK_EQ(punct->at(1).value.value(), "rfc822;a@b.c");

  CHECK(!esmtp_params_parse("SIZE="));
  CHECK(!esmtp_params_parse("=1"));
  CHECK(!esmtp_params_parse("A=b=c"));
  CHECK(!esmtp_params_parse("X-FOO=1"));
  CHECK(!esmtp_params_parse(" SIZE=1"));
  CHECK(!esmtp_params_parse("SIZE=1 "));
  CHECK(!esmtp_params_parse("SIZE=1\r\n"));
  CHECK(!esmtp_params_parse("A=\x7F"));
  CHECK(!esmtp_params_parse("A=\xC3\xA9"));
}
