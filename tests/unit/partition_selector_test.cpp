#include "internal/core/partition_selector.hpp"

#include <cassert>
#include <iostream>
#include <vector>

namespace {

using staging::core::PartitionPolicy;
using staging::core::PartitionSelector;
using staging::model::ColumnSpec;
using staging::model::PartitionStrategy;

void TestReferenceVolumes() {
  const PartitionSelector selector;

  assert(selector.Select(12'000'000, true, false) == PartitionStrategy::kRangeDate);
  assert(selector.Select(6'000'000, false, true) == PartitionStrategy::kRangeNumber);
  assert(selector.Select(2'000'000, false, false) == PartitionStrategy::kHash);
  assert(selector.Select(500'000, false, false) == PartitionStrategy::kNone);
}

void TestThresholdsAreStrict() {
  const PartitionSelector selector;

  assert(selector.Select(1'000'000, false, false) == PartitionStrategy::kNone);
  assert(selector.Select(1'000'001, false, false) == PartitionStrategy::kHash);
  assert(selector.Select(5'000'000, false, true) == PartitionStrategy::kHash);
  assert(selector.Select(10'000'000, true, false) == PartitionStrategy::kHash);
  assert(selector.Select(10'000'001, true, true) == PartitionStrategy::kRangeDate);
}

void TestSignalsOnlyApplyAboveTheirBand() {
  const PartitionSelector selector;

  // a date column alone below the date band does not force RANGE_DATE
  assert(selector.Select(7'000'000, true, false) == PartitionStrategy::kHash);
  assert(selector.Select(7'000'000, true, true) == PartitionStrategy::kRangeNumber);
  assert(selector.Select(0, true, true) == PartitionStrategy::kNone);
}

void TestSelectionIsDeterministic() {
  const PartitionSelector selector;
  for (int i = 0; i < 100; ++i) {
    assert(selector.Select(12'000'000, true, false) == PartitionStrategy::kRangeDate);
    assert(selector.Select(2'000'000, false, false) == PartitionStrategy::kHash);
  }
}

void TestColumnSignals() {
  const std::vector<ColumnSpec> dated = {{"ACCOUNT_NAME", "VARCHAR2(100)"}, {"posting_date", "date"}};
  const std::vector<ColumnSpec> keyed = {{"TRANSACTION_KEY", "NUMBER(19)"}, {"AMOUNT", "NUMBER"}};
  const std::vector<ColumnSpec> plain = {{"DESCRIPTION", "VARCHAR2(4000)"}, {"ACCOUNT_ID", "VARCHAR2(50)"}};

  assert(PartitionSelector::HasDateColumn(dated));
  assert(!PartitionSelector::HasNumericIdColumn(dated));
  assert(PartitionSelector::HasNumericIdColumn(keyed));
  assert(!PartitionSelector::HasDateColumn(keyed));
  assert(!PartitionSelector::HasDateColumn(plain));
  // ID in the name but not numeric
  assert(!PartitionSelector::HasNumericIdColumn(plain));
  assert(PartitionSelector::HasDateColumn(std::vector<ColumnSpec>{ColumnSpec{"CREATED", "TIMESTAMP(6)"}}));

  const PartitionSelector selector;
  assert(selector.Select(12'000'000, dated) == PartitionStrategy::kRangeDate);
  assert(selector.Select(6'000'000, keyed) == PartitionStrategy::kRangeNumber);
  assert(selector.Select(6'000'000, plain) == PartitionStrategy::kHash);
}

void TestCustomPolicy() {
  PartitionPolicy policy;
  policy.hash_min_records         = 10;
  policy.range_number_min_records = 100;
  policy.range_date_min_records   = 1000;

  const PartitionSelector selector(policy);
  assert(selector.Select(11, false, false) == PartitionStrategy::kHash);
  assert(selector.Select(101, false, true) == PartitionStrategy::kRangeNumber);
  assert(selector.Select(1001, true, false) == PartitionStrategy::kRangeDate);
  assert(selector.Policy().hash_min_records == 10);
}

} // namespace

int main() {
  TestReferenceVolumes();
  TestThresholdsAreStrict();
  TestSignalsOnlyApplyAboveTheirBand();
  TestSelectionIsDeterministic();
  TestColumnSignals();
  TestCustomPolicy();

  std::cout << "staging_manager_unit_partition_selector: pass\n";
  return 0;
}
