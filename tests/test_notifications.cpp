#include "core/notifications.h"
#include "core/clock.h"
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

using namespace coursedao::core;

static void testDeliveryOrderAndFilter() {
    NotificationBus bus;
    std::vector<std::string> seen;
    std::vector<uint64_t> sequences;

    bus.subscribeAll([&](const Notification& n) {
        seen.push_back(std::string("all:") + notificationTypeToString(n.type));
        sequences.push_back(n.sequence);
    });
    bus.subscribe(NotificationType::COURSE_CREATED, [&](const Notification& n) {
        seen.push_back("course:" + n.field("id"));
    });

    bus.publish(NotificationType::PROPOSAL_CREATED, 10, {{"id", "1"}});
    bus.publish(NotificationType::COURSE_CREATED, 11, {{"id", "7"}});

    assert(seen.size() == 3);
    assert(seen[0] == "all:ProposalCreated");
    assert(seen[1] == "all:CourseCreated");
    assert(seen[2] == "course:7");
    assert(sequences == (std::vector<uint64_t>{1, 2}));
    assert(bus.publishedCount() == 2);
}

static void testUnsubscribe() {
    NotificationBus bus;
    int calls = 0;
    uint64_t id = bus.subscribeAll([&](const Notification&) { calls++; });
    assert(bus.subscriptionCount() == 1);

    bus.publish(NotificationType::ROLE_GRANTED, 1, {});
    bus.unsubscribe(id);
    bus.publish(NotificationType::ROLE_GRANTED, 2, {});

    assert(calls == 1);
    assert(bus.subscriptionCount() == 0);
    assert(bus.publishedCount() == 2);
}

static void testFailingObserverDoesNotStopOthers() {
    NotificationBus bus;
    int delivered = 0;
    bus.subscribeAll([](const Notification&) { throw std::runtime_error("indexer down"); });
    bus.subscribeAll([&](const Notification& n) {
        assert(n.timestamp == 42);
        assert(n.field("missing").empty());
        delivered++;
    });

    bus.publish(NotificationType::TREASURY_PAYOUT, 42, {{"to", "t1"}, {"amount", "5"}});
    assert(delivered == 1);
}

static void testNonStandardThrowIsContained() {
    NotificationBus bus;
    int delivered = 0;
    bus.subscribe(NotificationType::ENROLLMENT_CONFIRMED, [](const Notification&) { throw 42; });
    bus.subscribe(NotificationType::ENROLLMENT_CONFIRMED, [&](const Notification&) { delivered++; });

    bus.publish(NotificationType::ENROLLMENT_CONFIRMED, 7, {{"student", "s1"}});
    bus.publish(NotificationType::ENROLLMENT_CONFIRMED, 8, {{"student", "s2"}});
    assert(delivered == 2);
    assert(bus.publishedCount() == 2);
}

static void testNotificationText() {
    Notification n;
    n.type = NotificationType::RATING_GIVEN;
    n.sequence = 3;
    n.fields = {{"value", "4"}, {"teacher", "t1"}};
    assert(n.toString() == "#3 RatingGiven teacher=t1 value=4");
}

static void testClocks() {
    ManualClock manual(100);
    assert(manual.now() == 100);
    assert(!manual.set(99));
    assert(manual.now() == 100);
    assert(manual.set(150));
    manual.advance(30);
    assert(manual.now() == 180);

    SystemClock sys;
    uint64_t a = sys.now();
    uint64_t b = sys.now();
    assert(a > 1600000000);
    assert(b >= a);
}

int main() {
    testDeliveryOrderAndFilter();
    testUnsubscribe();
    testFailingObserverDoesNotStopOthers();
    testNonStandardThrowIsContained();
    testNotificationText();
    testClocks();
    return 0;
}
