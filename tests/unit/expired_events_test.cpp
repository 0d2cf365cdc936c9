#include "internal/temporal/expired_events.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

using digest::model::EmailRecord;
using digest::temporal::ExtractCalendarDate;
using digest::temporal::ExtractRelativeStart;
using digest::temporal::FilterExpiredEvents;
using digest::temporal::IsExpiredEvent;
using digest::util::TimePoint;
using std::chrono::hours;
using std::chrono::minutes;

TimePoint At(const std::string& text) {
  auto parsed = digest::util::ParseTimestamp(text);
  assert(parsed && "timestamp must parse");
  return parsed.value;
}

EmailRecord Email(std::string id, std::string subject, std::string snippet, std::optional<std::string> date) {
  EmailRecord email;
  email.id      = std::move(id);
  email.subject = std::move(subject);
  email.snippet = std::move(snippet);
  email.date    = std::move(date);
  return email;
}

void TestAcceptedInviteExpiresAfterTheEvent() {
  const auto email = Email("acc", "Accepted: Victor <> Justin in town in NYC @ Tue Nov 18, 2025 (Justin)", "Victor Udoewa has accepted this invitation.",
                           std::string("Fri, 31 Oct 2025 18:55:01 +0000"));

  assert(!IsExpiredEvent(email, At("2025-11-01T12:00:00Z")));
  assert(IsExpiredEvent(email, At("2025-11-19T12:00:00Z")));
}

void TestStartsInReminder() {
  const auto email = Email("rem", "Don't forget: Drawing Hive starts in 1 hour", "Hi Justin K, We're kicking off \"Drawing Hive\" in 1 hour!",
                           std::string("Thu, 30 Oct 2025 22:01:15 +0000 (UTC)"));

  // sent 22:01, so the event started at 23:01
  assert(IsExpiredEvent(email, At("2025-10-31T12:00:00Z")));
  assert(!IsExpiredEvent(email, At("2025-10-30T21:00:00Z")));
}

void TestStartsInNeedsASendDate() {
  const auto email = Email("rem", "Yoga starts in 10 minutes", "", std::nullopt);
  assert(!IsExpiredEvent(email, At("2030-01-01T00:00:00Z")));
}

void TestCalendarNotifications() {
  const auto past = Email("n1", "Notification: J & V Catch-up @ Fri Oct 31, 2025 2pm - 2:25pm (EDT) (Justin)", "You have been invited...",
                          std::string("Fri, 31 Oct 2025 17:49:45 +0000"));
  assert(IsExpiredEvent(past, At("2025-11-01T10:00:00Z")));

  const auto updated = Email("n2", "Updated invitation: J & V Catch-up @ Fri Nov 7, 2025 2:05pm - 2:30pm (EST)", "You have been invited...",
                             std::string("Fri, 31 Oct 2025 08:26:54 +0000"));
  assert(!IsExpiredEvent(updated, At("2025-11-01T12:00:00Z")));
}

void TestSameDayBuffer() {
  const auto email = Email("n3", "Notification: Event @ Fri Nov 1, 2025 10am", "", std::string("Fri, 01 Nov 2025 09:00:00 +0000"));

  assert(!IsExpiredEvent(email, At("2025-11-01T11:00:00Z")));
  assert(!IsExpiredEvent(email, At("2025-11-01T12:00:00Z")));
  assert(IsExpiredEvent(email, At("2025-11-01T12:30:00Z")));
}

void TestNonEventsAreKept() {
  const auto task = Email("task", "Your upcoming General Mounting task", "Your General Mounting task is booked Friday, October 31 Arriving at 9:00am EDT",
                          std::string("Fri, 31 Oct 2025 02:07:12 +0000 (UTC)"));
  assert(!IsExpiredEvent(task, At("2025-11-01T12:00:00Z")));

  const auto bill = Email("bill", "Your Con Edison bill is ready", "Your Con Edison Bill is ready 11/01/2025 Amount to be deducted $186.56",
                          std::string("Sat, 01 Nov 2025 13:06:32 +0000 (UTC)"));
  assert(!IsExpiredEvent(bill, At("2025-11-01T14:00:00Z")));
}

void TestUnparseableOrMissingDataIsKept() {
  assert(!IsExpiredEvent(Email("bad", "Accepted: Event @ ???", "", std::string("invalid date")), At("2025-11-01T12:00:00Z")));
  assert(!IsExpiredEvent(EmailRecord{}, At("2025-11-01T12:00:00Z")));

  // A bad send date keeps the email even when the subject date is past.
  assert(!IsExpiredEvent(Email("bad", "Accepted: Event @ Tue Oct 29, 2025", "", std::string("not a date")), At("2025-11-01T12:00:00Z")));
}

void TestTemporalStartOnlyCountsForEvents() {
  const auto now = At("2025-11-01T12:00:00Z");

  auto event           = Email("evt", "Team lunch", "", std::nullopt);
  event.type           = "event";
  event.temporal_start = "2025-11-01T09:00:00Z";
  assert(IsExpiredEvent(event, now));

  event.temporal_start = "2025-11-01T11:30:00Z";
  assert(!IsExpiredEvent(event, now));

  event.type           = "calendar";
  event.temporal_start = "2025-10-31T12:00:00Z";
  assert(IsExpiredEvent(event, now));

  auto receipt           = Email("rcpt", "Your receipt", "", std::nullopt);
  receipt.type           = "receipt";
  receipt.temporal_start = "2025-10-01T00:00:00Z";
  assert(!IsExpiredEvent(receipt, now));

  // unparseable start falls through to the other checks
  event.temporal_start = "sometime";
  assert(!IsExpiredEvent(event, now));
}

void TestFilterKeepsOrderAndReportsIds() {
  std::vector<EmailRecord> emails;
  emails.push_back(Email("past", "Accepted: Event @ Tue Oct 29, 2025", "", std::string("Tue, 29 Oct 2025 10:00:00 +0000")));
  emails.push_back(Email("future", "Notification: Event @ Fri Nov 7, 2025", "", std::string("Fri, 31 Oct 2025 10:00:00 +0000")));
  emails.push_back(Email("bill", "Your bill is ready", "Bill amount: $100", std::nullopt));

  std::vector<std::string> expired;
  auto kept = FilterExpiredEvents(emails, At("2025-11-01T12:00:00Z"), &expired);

  assert(kept.size() == 2);
  assert(kept[0].id == "future");
  assert(kept[1].id == "bill");
  assert(expired == std::vector<std::string>{"past"});
}

void TestCalendarDateExtraction() {
  assert(*ExtractCalendarDate("Accepted: Victor @ Tue Nov 18, 2025 (Justin)", 2000) == At("2025-11-18T00:00:00Z"));
  assert(*ExtractCalendarDate("Notification: Event @ Fri Nov 1, 2025 10am", 2000) == At("2025-11-01T10:00:00Z"));
  assert(*ExtractCalendarDate("Notification: Event @ Fri Nov 1, 2025 12am", 2000) == At("2025-11-01T00:00:00Z"));
  assert(*ExtractCalendarDate("Notification: Event @ Fri Nov 1, 2025 12pm", 2000) == At("2025-11-01T12:00:00Z"));
  assert(*ExtractCalendarDate("Notification: Event @ Wed Oct 29", 2025) == At("2025-10-29T00:00:00Z"));
  assert(*ExtractCalendarDate("Accepted: Sync @ thu september 4, 2025", 2000) == At("2025-09-04T00:00:00Z"));

  assert(!ExtractCalendarDate("Accepted: Event @ ???", 2025));
  assert(!ExtractCalendarDate("Accepted: Event @ Mon Foo 3, 2025", 2025));
  assert(!ExtractCalendarDate("Accepted: Event @ Mon Nov 31, 2025", 2025));
  assert(!ExtractCalendarDate("Lunch on Friday", 2025));
}

void TestRelativeStartExtraction() {
  const auto sent = At("2025-10-30T12:00:00Z");

  assert(*ExtractRelativeStart("Webinar starts in 2 hours", sent) == sent + hours(2));
  assert(*ExtractRelativeStart("Sale starts in 3 days", sent) == sent + hours(72));
  assert(*ExtractRelativeStart("Class STARTS IN 15 minutes", sent) == sent + minutes(15));
  assert(*ExtractRelativeStart("Standup starts in 1hr", sent) == sent + hours(1));
  assert(!ExtractRelativeStart("Starts soon", sent));
}

} // namespace

int main() {
  TestAcceptedInviteExpiresAfterTheEvent();
  TestStartsInReminder();
  TestStartsInNeedsASendDate();
  TestCalendarNotifications();
  TestSameDayBuffer();
  TestNonEventsAreKept();
  TestUnparseableOrMissingDataIsKept();
  TestTemporalStartOnlyCountsForEvents();
  TestFilterKeepsOrderAndReportsIds();
  TestCalendarDateExtraction();
  TestRelativeStartExtraction();

  std::cout << "digest_unit_expired_events: pass\n";
  return 0;
}
