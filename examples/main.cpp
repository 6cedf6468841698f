#include <iostream>
#include <sstream>

#include "dumpflux/extractor.hpp"
#include "dumpflux/memory_sink.hpp"
#include "dumpflux/report.hpp"

int main() {
  using namespace dumpflux;

  std::istringstream dump(
      "-- MySQL dump\n"
      "CREATE TABLE `users` (\n"
      "  `id` int NOT NULL,\n"
      "  `name` varchar(64) DEFAULT NULL,\n"
      "  PRIMARY KEY (`id`)\n"
      ") ENGINE=InnoDB;\n"
      "INSERT INTO `users` VALUES (1,'Ada'),(2,NULL),(3,'O\\'Brien');\n"
      "CREATE TABLE `tags` (\n"
      "  `user_id` int,\n"
      "  `tag` varchar(32)\n"
      ");\n"
      "INSERT INTO `tags` VALUES (1,'admin'),(3,'ops, on-call');\n");

  MemoryCatalog catalog;
  ExtractionSummary summary = ExtractStream(dump, catalog);

  for (const auto& [name, data] : catalog.tables()) {
    std::cout << name << ":";
    for (const auto& c : data.columns) {
      std::cout << ' ' << c;
    }
    std::cout << '\n';
    for (const auto& row : data.rows) {
      std::cout << " ";
      for (const auto& field : row) {
        std::cout << ' ' << (field ? *field : "NULL");
      }
      std::cout << '\n';
    }
  }
  std::cout << FormatSummary(summary);
  return 0;
}
