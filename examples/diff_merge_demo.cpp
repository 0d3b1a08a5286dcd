/**
 * @file diff_merge_demo.cpp
 * @brief Compare two configuration files and merge the differences.
 *
 * Usage: diff_merge_demo [base.ini changed.ini]
 * Without arguments two built-in documents are used.
 */

#include "iniedit/diff.hpp"
#include "iniedit/parser.hpp"
#include "iniedit/serializer.hpp"

#include <cstdio>
#include <utility>

namespace {

const char kBase[] =
    "[server]\n"
    "host = localhost\n"
    "port = 8080\n"
    "debug = true\n"
    "[legacy]\n"
    "enabled = yes\n";

const char kChanged[] =
    "[server]\n"
    "host = example.com\n"
    "port = 8080\n"
    "workers = 4\n"
    "[cache]\n"
    "size = 128\n";

void PrintDiff(const iniedit::DocumentDiff& diff) {
  for (const auto& sec : diff.added_sections) {
    std::printf("+ [%s]\n", sec.Name().c_str());
  }
  for (const auto& sec : diff.removed_sections) {
    std::printf("- [%s]\n", sec.Name().c_str());
  }
  for (const auto& sd : diff.modified_sections) {
    std::printf("~ [%s]\n", sd.section_name.c_str());
    for (const auto& p : sd.added_properties) {
      std::printf("    + %s = %s\n", p.Name().c_str(), p.Value().c_str());
    }
    for (const auto& p : sd.removed_properties) {
      std::printf("    - %s\n", p.Name().c_str());
    }
    for (const auto& m : sd.modified_properties) {
      std::printf("    ~ %s: %s -> %s\n", m.property_name.c_str(),
                  m.old_value.c_str(), m.new_value.c_str());
    }
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  iniedit::LoadResult base = (argc > 2) ? iniedit::LoadFile(argv[1])
                                        : iniedit::LoadString(kBase);
  iniedit::LoadResult changed = (argc > 2) ? iniedit::LoadFile(argv[2])
                                           : iniedit::LoadString(kChanged);
  if (!base || !changed) {
    const auto& err = !base ? base.get_error() : changed.get_error();
    std::fprintf(stderr, "load failed: %s\n", err.message.c_str());
    return 1;
  }

  iniedit::DocumentDiff diff = iniedit::Compare(base.value(), changed.value());
  if (!diff.HasChanges()) {
    std::printf("documents are equivalent\n");
    return 0;
  }
  PrintDiff(diff);

  iniedit::MergeOptions opts;
  opts.apply_removed_properties = true;
  iniedit::Document target = std::move(base).value();
  iniedit::MergeResult res = iniedit::Merge(target, diff, opts);
  std::printf("merged %u change(s): +%u sections, +%u/-%u/~%u properties\n",
              res.TotalChanges(), res.sections_added, res.properties_added,
              res.properties_removed, res.properties_modified);
  std::printf("%s", iniedit::SaveString(target).value().c_str());
  return 0;
}
