#ifndef NORTHWIND_FIXTURE_H
#define NORTHWIND_FIXTURE_H

#include "catalog/history_types.h"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// Customers, orders and order lines of the Northwind sample, wired together
// through their hooks: order lines reference orders, orders reference
// customers.
inline json northwindEntities() {
  return json::parse(R"({
    "entities": [
      {
        "name": "customers",
        "key_columns": ["customer_id"],
        "attributes": ["customer_id", "company_name", "city"],
        "hooks": [
          {"name": "_hook__customer", "keyset": "northwind.customer.id",
           "expression": "customer_id", "primary": true}
        ]
      },
      {
        "name": "orders",
        "key_columns": ["order_id"],
        "attributes": ["order_id", "customer_id", "order_date", "shipped_date"],
        "hooks": [
          {"name": "_hook__order", "keyset": "northwind.order.id",
           "expression": "order_id", "primary": true},
          {"name": "_hook__customer", "keyset": "northwind.customer.id",
           "expression": "customer_id"}
        ],
        "events": [
          {"name": "order_placed", "expression": "order_date"},
          {"name": "order_shipped", "expression": "shipped_date"}
        ]
      },
      {
        "name": "order_details",
        "key_columns": ["order_id", "product_id"],
        "attributes": ["order_id", "product_id", "quantity"],
        "hooks": [
          {"name": "_hook__order", "keyset": "northwind.order.id",
           "expression": "order_id"},
          {"name": "_hook__product", "keyset": "northwind.product.id",
           "expression": "product_id"}
        ],
        "composite_hooks": [
          {"name": "_hook__order__product",
           "hooks": ["_hook__order", "_hook__product"], "primary": true}
        ]
      }
    ]
  })");
}

inline Timestamp marchDay(unsigned day, unsigned hour = 0) {
  return TimeUtils::makeTimestamp(2024, 3, day, hour);
}

// Load id as the extractor writes it: whole seconds since the epoch.
inline std::string loadIdOf(Timestamp ts) {
  return std::to_string(TimeUtils::toEpochMicros(ts) / 1000000);
}

inline json customerRow(const std::string &id, const std::string &city,
                        Timestamp loadedAt) {
  return json{{"customer_id", id},
              {"company_name", id + " GmbH"},
              {"city", city},
              {"_dlt_load_id", loadIdOf(loadedAt)},
              {"_dlt_id", id + "-" + loadIdOf(loadedAt)}};
}

inline json orderRow(int orderId, const std::string &customerId,
                     const std::string &orderDate, const json &shippedDate,
                     Timestamp loadedAt) {
  return json{{"order_id", orderId},
              {"customer_id", customerId},
              {"order_date", orderDate},
              {"shipped_date", shippedDate},
              {"_dlt_load_id", loadIdOf(loadedAt)}};
}

inline json orderDetailRow(int orderId, int productId, int quantity,
                           Timestamp loadedAt) {
  return json{{"order_id", orderId},
              {"product_id", productId},
              {"quantity", quantity},
              {"_dlt_load_id", loadIdOf(loadedAt)}};
}

#endif
