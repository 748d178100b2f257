#include "../northwind_fixture.h"
#include "../test_runner.h"
#include "sync/BridgeResolver.h"
#include "sync/HookCodec.h"

namespace {

BridgeRow row(const std::string &peripheral,
              std::map<std::string, std::string> hooks, Timestamp from,
              Timestamp to, Timestamp updated, bool current) {
  BridgeRow r;
  r.peripheral = peripheral;
  r.hooks = std::move(hooks);
  r.valid_from = from;
  r.valid_to = to;
  r.updated_at = updated;
  r.is_current = current;
  return r;
}

std::string fmt(Timestamp ts) { return TimeUtils::formatTimestamp(ts); }

const std::string ALFKI = "northwind.customer.id|ALFKI";
const std::string ORDER = "northwind.order.id|10248";

} // namespace

int main() {
  TestRunner runner;
  const Timestamp epoch = TimeUtils::minTimestamp();
  const Timestamp forever = TimeUtils::maxTimestamp();

  // ALFKI moved on day 5; order 10248 was loaded once on day 3.
  std::vector<BridgeRow> customers = {
      row("customers",
          {{"_hook__customer", ALFKI},
           {"_pit_hook__customer", HookCodec::composePit(ALFKI, epoch)}},
          epoch, marchDay(5), marchDay(5), false),
      row("customers",
          {{"_hook__customer", ALFKI},
           {"_pit_hook__customer", HookCodec::composePit(ALFKI, marchDay(1))}},
          marchDay(1), forever, marchDay(5), true)};
  customers[0].attributes = {{"city__customers", "Berlin"}};
  customers[1].attributes = {{"city__customers", "Hamburg"}};

  std::vector<BridgeRow> orders = {
      row("orders",
          {{"_hook__order", ORDER},
           {"_hook__customer", ALFKI},
           {"_pit_hook__order", HookCodec::composePit(ORDER, epoch)}},
          epoch, forever, marchDay(3), true)};
  orders[0].attributes = {{"order_id__orders", 10248}};

  runner.runTest("Order joined with every overlapping customer version", [&]() {
    BridgeResolver resolver;
    auto joined = resolver.join(orders, customers, "_hook__customer");
    runner.assertEquals(static_cast<size_t>(2), joined.size(), "two rows");

    const BridgeRow &first = joined[0];
    runner.assertEquals(std::string("orders"), first.peripheral,
                        "left side is the peripheral");
    runner.assertEquals(fmt(epoch), fmt(first.valid_from), "later start");
    runner.assertEquals(fmt(marchDay(5)), fmt(first.valid_to), "earlier end");
    runner.assertEquals(fmt(marchDay(5)), fmt(first.updated_at),
                        "later update");
    runner.assertFalse(first.is_current, "customer version closed");
    runner.assertEquals(std::string("Berlin"),
                        first.attributes["city__customers"].get<std::string>(),
                        "customer attribute carried");
    runner.assertEquals(10248, first.attributes["order_id__orders"].get<int>(),
                        "order attribute carried");

    const BridgeRow &second = joined[1];
    runner.assertEquals(fmt(marchDay(1)), fmt(second.valid_from),
                        "starts with the second version");
    runner.assertEquals(fmt(forever), fmt(second.valid_to), "open ended");
    runner.assertTrue(second.is_current, "both sides current");
    runner.assertTrue(second.hooks.count("_pit_hook__customer") == 1,
                      "right pit hook merged");
    runner.assertTrue(first.rowKey() != second.rowKey(), "distinct identity");
    runner.assertEquals(static_cast<size_t>(2), resolver.stats().matched_pairs,
                        "matched pairs");
  });

  runner.runTest("Open-ended customer joined with a bounded order", [&]() {
    std::vector<BridgeRow> boundedOrder = {
        row("orders",
            {{"_hook__order", ORDER},
             {"_hook__customer", ALFKI},
             {"_pit_hook__order", HookCodec::composePit(ORDER, marchDay(2))}},
            marchDay(2), marchDay(4), marchDay(4), false)};
    std::vector<BridgeRow> openCustomer = {
        row("customers",
            {{"_hook__customer", ALFKI},
             {"_pit_hook__customer", HookCodec::composePit(ALFKI, marchDay(1))}},
            marchDay(1), forever, marchDay(1), true)};

    BridgeResolver resolver;
    auto joined =
        resolver.join(boundedOrder, openCustomer, "_hook__customer");
    runner.assertEquals(static_cast<size_t>(1), joined.size(), "one row");
    runner.assertEquals(fmt(marchDay(2)), fmt(joined[0].valid_from),
                        "starts with the order");
    runner.assertEquals(fmt(marchDay(4)), fmt(joined[0].valid_to),
                        "ends with the order");
    runner.assertEquals(fmt(marchDay(4)), fmt(joined[0].updated_at),
                        "order update is the later one");
    runner.assertFalse(joined[0].is_current, "order version closed");
  });

  runner.runTest("Versions that do not overlap are not joined", [&]() {
    std::vector<BridgeRow> lateOrder = {
        row("orders", {{"_hook__customer", ALFKI}}, marchDay(6), forever,
            marchDay(6), true)};
    BridgeResolver resolver;
    auto joined = resolver.join(lateOrder, {customers[0]}, "_hook__customer");
    runner.assertTrue(joined.empty(), "no overlap");
    runner.assertEquals(static_cast<size_t>(1),
                        resolver.stats().non_overlapping, "counted");
    runner.assertFalse(BridgeResolver::overlaps(lateOrder[0], customers[0]),
                       "disjoint intervals do not overlap");
  });

  runner.runTest("Left join keeps unmatched rows", [&]() {
    std::vector<BridgeRow> orphan = {
        row("orders",
            {{"_hook__customer", "northwind.customer.id|NOBODY"},
             {"_pit_hook__order", HookCodec::composePit(ORDER, epoch)}},
            epoch, forever, marchDay(3), true)};
    BridgeResolver resolver;
    runner.assertTrue(
        resolver.join(orphan, customers, "_hook__customer").empty(),
        "inner join drops it");
    auto joined =
        resolver.join(orphan, customers, "_hook__customer", JoinType::LEFT);
    runner.assertEquals(static_cast<size_t>(1), joined.size(), "kept");
    runner.assertTrue(joined[0].hooks.count("_pit_hook__customer") == 1 &&
                          joined[0].hooks.at("_pit_hook__customer").empty(),
                      "right pit column present and empty");
    runner.assertTrue(joined[0].toJson()["_pit_hook__customer"].is_null(),
                      "rendered as null");
    runner.assertTrue(joined[0].is_current, "validity untouched");
  });

  runner.runTest("Malformed hook values are excluded", [&]() {
    std::vector<BridgeRow> bad = orders;
    bad[0].hooks["_hook__customer"] = "ALFKI";
    BridgeResolver resolver;
    auto joined = resolver.join(bad, customers, "_hook__customer",
                                JoinType::LEFT);
    runner.assertTrue(joined.empty(), "row dropped even for a left join");
    runner.assertEquals(static_cast<size_t>(1), resolver.stats().malformed,
                        "counted");
    resolver.resetStats();
    runner.assertEquals(static_cast<size_t>(0), resolver.stats().malformed,
                        "reset");
  });

  runner.runTest("Chained joins associate", [&]() {
    const std::string detail =
        HookCodec::composeComposite({ORDER, "northwind.product.id|11"});
    std::vector<BridgeRow> details = {
        row("order_details",
            {{"_hook__order", ORDER},
             {"_pit_hook__order__product",
              HookCodec::composePit(detail, epoch)}},
            epoch, marchDay(4), marchDay(4), false),
        row("order_details",
            {{"_hook__order", ORDER},
             {"_pit_hook__order__product",
              HookCodec::composePit(detail, marchDay(2))}},
            marchDay(2), forever, marchDay(4), true)};

    BridgeResolver resolver;
    auto leftFirst = resolver.join(
        resolver.join(details, orders, "_hook__order"), customers,
        "_hook__customer");
    auto rightFirst = resolver.join(
        details, resolver.join(orders, customers, "_hook__customer"),
        "_hook__order");

    runner.assertEquals(leftFirst.size(), rightFirst.size(), "same size");
    bool same = leftFirst.size() == rightFirst.size();
    for (size_t i = 0; same && i < leftFirst.size(); ++i)
      same = leftFirst[i] == rightFirst[i];
    runner.assertTrue(same, "same rows");
    runner.assertEquals(static_cast<size_t>(4), leftFirst.size(),
                        "every overlapping combination");
  });

  return runner.printSummary();
}
