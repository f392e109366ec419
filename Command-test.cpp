#include "Command.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  // MAIL FROM

  auto const bounce = MailFrom::parse("MAIL FROM:<>");
  CHECK(bounce);
  CHECK(bounce->reverse_path.is_null());
  CHECK(bounce->parameters.empty());

  CHECK(MailFrom::parse("mail from:<>"));
  CHECK(MailFrom::parse("Mail From:<>"));

  auto const mail
      = MailFrom::parse("MAIL FROM:<a@example.org> SIZE=1000 BODY=8BITMIME");
  CHECK(mail);
  CHECK_EQ(mail->reverse_path, ReversePath{Mailbox{"a@example.org"}});
  CHECK_EQ(mail->parameters.size(), 2u);
  CHECK_EQ(mail->parameters[0], (EsmtpParam{"SIZE", "1000"}));
  CHECK_EQ(mail->parameters[1], (EsmtpParam{"BODY", "8BITMIME"}));

  auto const routed = MailFrom::parse("MAIL FROM:<@a.example:b@c.example>");
  CHECK(routed);
  CHECK_EQ(routed->reverse_path.as_string(), "<b@c.example>");

  // A bare word after the path is a parameter with no value.
  auto const extra = MailFrom::parse("MAIL FROM:<a@b.com> extra");
  CHECK(extra);
  CHECK_EQ(extra->parameters.size(), 1u);
  CHECK_EQ(extra->parameters[0], (EsmtpParam{"extra", std::nullopt}));

  // Anything that is not parameter syntax is trailing garbage.
  CHECK(!MailFrom::parse("MAIL FROM:<a@b.com> =extra"));
  CHECK(!MailFrom::parse("MAIL FROM:<a@b.com> extra!"));
  CHECK(!MailFrom::parse("MAIL FROM:<a@b.com>extra"));
  CHECK(!MailFrom::parse("MAIL FROM:<a@b.com> "));
  CHECK(!MailFrom::parse("MAIL FROM:<a@b.com>\r\n"));

  CHECK(!MailFrom::parse(""));
  CHECK(!MailFrom::parse("MAIL FROM:"));
  CHECK(!MailFrom::parse("MAIL FROM: <a@b.com>"));
  CHECK(!MailFrom::parse("MAIL FROM:a@b.com"));
  CHECK(!MailFrom::parse("MAIL  FROM:<a@b.com>"));
  CHECK(!MailFrom::parse("MAIL FROM:<postmaster>"));
  CHECK(!MailFrom::parse("MAIL FROM:<\xC3\xA9@b.com>"));
  CHECK(!MailFrom::parse("RCPT TO:<a@b.com>"));

  // RCPT TO

  auto const pm = RcptTo::parse("RCPT TO:<postmaster>");
  CHECK(pm);
  CHECK(pm->forward_path.is_postmaster());
  CHECK(pm->parameters.empty());

  CHECK(RcptTo::parse("rcpt to:<Postmaster>"));

  auto const rcpt = RcptTo::parse(
      "RCPT TO:<a@b.com> NOTIFY=SUCCESS,FAILURE ORCPT=rfc822;a@b.com");
  CHECK(rcpt);
  CHECK(!rcpt->forward_path.is_postmaster());
  CHECK_EQ(rcpt->forward_path.as_string(), "<a@b.com>");
  CHECK_EQ(rcpt->parameters.size(), 2u);
  CHECK_EQ(rcpt->parameters[0], (EsmtpParam{"NOTIFY", "SUCCESS,FAILURE"}));
  CHECK_EQ(rcpt->parameters[1], (EsmtpParam{"ORCPT", "rfc822;a@b.com"}));

  auto const lit = RcptTo::parse("RCPT TO:<a@[IPv6:2001:db8::1]>");
  CHECK(lit);
  CHECK_EQ(lit->forward_path.as_string(), "<a@[IPv6:2001:db8::1]>");

  CHECK(!RcptTo::parse("RCPT TO:<>"));
  CHECK(!RcptTo::parse("RCPT TO:<postmaster> "));
  CHECK(!RcptTo::parse("RCPT TO:<a@b.com>\r\n"));
  CHECK(!RcptTo::parse("RCPT TO:<a@[somewhere]>"));
  CHECK(!RcptTo::parse("RCPT TO:<a@foo-.example.org>"));
  CHECK(!RcptTo::parse("MAIL FROM:<a@b.com>"));
}
