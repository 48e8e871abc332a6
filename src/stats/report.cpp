/**
 * @file report.cpp
 * @brief Statistics report returned to API callers
 */

#include "stats/report.h"

namespace dnsstatd::stats {

namespace {

nlohmann::json TopToJson(const std::vector<NameCount>& top) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& entry : top) {
    array.push_back(nlohmann::json{{entry.name, entry.count}});
  }
  return array;
}

}  // namespace

Report BuildReport(const std::vector<UnitRecord>& records, uint32_t first_id, const IgnoreList* ignored) {
  Report report;
  report.time_unit = SelectTimeUnit(static_cast<uint32_t>(records.size()));

  report.dns_queries =
      CollectSeries(records, first_id, report.time_unit, [](const UnitRecord& record) { return record.total; });
  report.blocked_filtering = CollectSeries(records, first_id, report.time_unit,
                                           [](const UnitRecord& record) { return record.Count(Result::kFiltered); });
  report.replaced_safebrowsing = CollectSeries(
      records, first_id, report.time_unit, [](const UnitRecord& record) { return record.Count(Result::kSafeBrowsing); });
  report.replaced_parental = CollectSeries(records, first_id, report.time_unit,
                                           [](const UnitRecord& record) { return record.Count(Result::kParental); });

  report.top_queried_domains = CollectTopN(
      records, kMaxReportDomains,
      [](const UnitRecord& record) -> const std::vector<NameCount>& { return record.domains; }, ignored);
  report.top_blocked_domains = CollectTopN(
      records, kMaxReportDomains,
      [](const UnitRecord& record) -> const std::vector<NameCount>& { return record.blocked_domains; }, ignored);
  report.top_clients = CollectTopN(records, kMaxReportClients,
                                   [](const UnitRecord& record) -> const std::vector<NameCount>& { return record.clients; });

  report.totals = SumTotals(records);
  report.avg_processing_time = AverageProcessingTime(records);

  return report;
}

nlohmann::json ReportToJson(const Report& report) {
  nlohmann::json json;
  json["time_units"] = TimeUnitToString(report.time_unit);
  json["dns_queries"] = report.dns_queries;
  json["blocked_filtering"] = report.blocked_filtering;
  json["replaced_safebrowsing"] = report.replaced_safebrowsing;
  json["replaced_parental"] = report.replaced_parental;
  json["top_queried_domains"] = TopToJson(report.top_queried_domains);
  json["top_blocked_domains"] = TopToJson(report.top_blocked_domains);
  json["top_clients"] = TopToJson(report.top_clients);
  json["num_dns_queries"] = report.totals.num_dns_queries;
  json["num_blocked_filtering"] = report.totals.num_blocked_filtering;
  json["num_replaced_safebrowsing"] = report.totals.num_replaced_safebrowsing;
  json["num_replaced_safesearch"] = report.totals.num_replaced_safesearch;
  json["num_replaced_parental"] = report.totals.num_replaced_parental;
  json["avg_processing_time"] = report.avg_processing_time;
  return json;
}

}  // namespace dnsstatd::stats
