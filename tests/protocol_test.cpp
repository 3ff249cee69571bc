#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

#include <gtest/gtest.h>

using namespace atlink::protocols;

TEST(framing, wraps_body_in_prefix_and_crlf) {
  EXPECT_EQ(frame(""), "AT\r\n");
  EXPECT_EQ(frame("E0"), "ATE0\r\n");
  EXPECT_EQ(frame("+COPS?"), "AT+COPS?\r\n");
  // no validation: control bytes pass straight through
  EXPECT_EQ(frame(std::string("\r\x01", 2)), std::string("AT\r\x01\r\n", 6));
}

TEST(framing, read_and_execute_forms) {
  EXPECT_EQ(readForm("COPS"), "+COPS?");
  EXPECT_EQ(executeForm("CFUN"), "+CFUN");
  EXPECT_EQ((Command{ "COPS", CommandForm::Read }).toWire(), "AT+COPS?\r\n");
  EXPECT_EQ((Command{ "CGATT", CommandForm::Execute }).toWire(), "AT+CGATT\r\n");
  EXPECT_EQ((Command{ "I", CommandForm::Basic }).toWire(), "ATI\r\n");
}

TEST(framing, well_known_bodies) {
  EXPECT_EQ(toBody(CommandBody::Probe), "");
  EXPECT_EQ(toBody(CommandBody::EchoOff), "E0");
  EXPECT_EQ(toBody(CommandBody::EchoOn), "E1");
  EXPECT_EQ(toBody(CommandBody::NetworkOperator), "COPS");
  EXPECT_EQ(frame(readForm(toBody(CommandBody::NetworkOperator))), "AT+COPS?\r\n");
}

TEST(classification, only_trimmed_ok_is_success) {
  EXPECT_TRUE(isOkStatus("OK"));
  EXPECT_TRUE(isOkStatus(" OK "));
  EXPECT_TRUE(isOkStatus("\tOK\r"));
  EXPECT_FALSE(isOkStatus("ERROR"));
  EXPECT_FALSE(isOkStatus(""));
  EXPECT_FALSE(isOkStatus("ok"));
  EXPECT_FALSE(isOkStatus("OKAY"));
  EXPECT_FALSE(isOkStatus("+CME ERROR: 10"));
}

TEST(classification, continuation_marker) {
  EXPECT_TRUE(isContinuation("+COPS: 0,0,\"Carrier\""));
  EXPECT_FALSE(isContinuation("OK"));
  EXPECT_FALSE(isContinuation(""));
  EXPECT_FALSE(isContinuation(" +COPS"));
}

TEST(classification, trim_handles_blank_input) {
  EXPECT_EQ(trim("   "), "");
  EXPECT_EQ(trim(""), "");
  EXPECT_EQ(trim(" a b "), "a b");
}
