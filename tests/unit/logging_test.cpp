#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace ragturn::observability;

void TestFieldsAreKeyValuePairs() {
  assert(FormatLogLine("turn completed", {}) == "turn completed");
  assert(FormatLogLine("turn completed", {IntField("charged_cents", 12), BoolField("personal", false)}) ==
         "turn completed charged_cents=12 personal=false");
  assert(FormatLogLine("index", {DoubleField("elapsed_ms", 1.23456)}) == "index elapsed_ms=1.235");
}

void TestValuesNeedingQuotesAreEscaped() {
  assert(FormatLogLine("x", {StringField("error", "no \"route\"\nto host")}) == "x error=\"no \\\"route\\\" to host\"");
  assert(FormatLogLine("x", {StringField("model_id", "")}) == "x model_id=\"\"");
  assert(FormatLogLine("x", {StringField("filter", "a=b")}) == "x filter=\"a=b\"");
}

void TestCredentialKeysAreRedacted() {
  const auto line = FormatLogLine("key", {StringField("api_key", "sk-live-123"), StringField("provider_secret", "s3"),
                                          StringField("credential_id", "cred-1")});
  assert(line == "key api_key=[redacted] provider_secret=[redacted] credential_id=cred-1");
}

void TestScopedContextNestsAndUnwinds() {
  assert(CurrentLogContext().empty());
  {
    ScopedLogContext thread({StringField("thread_id", "t1")});
    assert(FormatLogLine("a", {IntField("n", 1)}) == "a n=1 thread_id=t1");
    {
      ScopedLogContext request({StringField("request_id", "r1")});
      assert(CurrentLogContext().size() == 2);
      assert(FormatLogLine("b", {}) == "b thread_id=t1 request_id=r1");
    }
    assert(FormatLogLine("c", {}) == "c thread_id=t1");
  }
  assert(CurrentLogContext().empty());
  assert(FormatLogLine("d", {}) == "d");
}

void TestLoggingWithoutInitialization() {
  ScopedLogContext ctx({StringField("request_id", "r2")});
  LogInfo("uninitialized logger", {IntField("n", 1)});
  RAGTURN_LOG_WARN("macro form");

  SpanScope span("test.span");
  span.RecordException(ragturn::util::UpstreamFailure("provider_request_failed", "upstream"));
  span.RecordException(std::runtime_error("plain"));
}

} // namespace

int main() {
  TestFieldsAreKeyValuePairs();
  TestValuesNeedingQuotesAreEscaped();
  TestCredentialKeysAreRedacted();
  TestScopedContextNestsAndUnwinds();
  TestLoggingWithoutInitialization();

  std::cout << "ragturn_unit_logging: pass\n";
  return 0;
}
