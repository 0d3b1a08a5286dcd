/**
 * @file iniedit_demo.cpp
 * @brief Walk-through of the iniedit document model.
 *
 * Demonstrates:
 *   - Loading INI text with error collection turned on
 *   - Typed reads, array values and edits that keep comments
 *   - Validating user input before applying it
 *   - Undo with DocumentSnapshot
 *   - Saving back to text and exporting to CSV
 */

#include "iniedit/iniedit.hpp"

#include <cstdio>
#include <string>
#include <utility>

static const char kConfig[] =
    "; global settings\n"
    "app = demo\n"
    "\n"
    "[Network] ; connection parameters\n"
    "host = 127.0.0.1\n"
    "port = 8080\n"
    "peers = {10.0.0.1, 10.0.0.2}\n"
    "this line is broken\n"
    "\n"
    "# logging\n"
    "[Log]\n"
    "level = \"info\" # default\n"
    "path = ${HOME}/demo.log\n";

int main() {
  iniedit::log::Init();
  iniedit::log::SetLevel(iniedit::log::Level::kDebug);

  // -- Load ------------------------------------------------------------------

  iniedit::LoadOptions opts;
  opts.collect_parsing_errors = true;
  auto loaded = iniedit::LoadString(kConfig, opts);
  if (!loaded) {
    std::printf("load failed: %s\n", loaded.get_error().message.c_str());
    return 1;
  }
  iniedit::Document doc = std::move(loaded).value();

  for (const auto& err : doc.ParsingErrors()) {
    std::printf("line %u skipped (%s): '%s'\n", err.line_number,
                err.reason.c_str(), err.line.c_str());
  }

  // -- Typed access ----------------------------------------------------------

  int port = doc.GetValueOrDefault<int>("network", "port", 80);
  std::printf("port = %d\n", port);

  const iniedit::Property* peers = doc.FindSection("network")->FindProperty("peers");
  auto list = peers->GetValueArray<std::string>();
  if (list) {
    for (const auto& peer : list.value()) {
      std::printf("peer: %s\n", peer.c_str());
    }
  }

  // -- Validated edit with undo ---------------------------------------------

  auto created = iniedit::DocumentSnapshot::Create(doc, 5);
  iniedit::DocumentSnapshot& history = created.value();
  history.TakeSnapshot();

  iniedit::Validator validator(doc);
  const std::string new_key = "timeout";
  if (validator.ValidateKey(new_key)) {
    iniedit::Section* net = doc.FindSection("Network");
    auto* prop = net->SetProperty(new_key, "30").value();
    (void)prop->PreComments().Add(doc.DefaultCommentPrefix(), " seconds");
  }
  iniedit::ValidationResult bad = validator.ValidateSectionName("a[b]");
  std::printf("validate 'a[b]': %s\n", bad.message.c_str());

  std::printf("--- edited ---\n%s", iniedit::SaveString(doc).value().c_str());

  if (history.Undo()) {
    std::printf("--- after undo ---\n%s", iniedit::SaveString(doc).value().c_str());
  }

  // -- Environment and export ------------------------------------------------

  iniedit::SubstituteEnvironmentVariables(doc);
  std::printf("--- csv ---\n%s", iniedit::ToCsv(doc).c_str());

  auto saved = iniedit::SaveFile(doc, "iniedit_demo.ini");
  if (!saved) {
    std::printf("save failed: %s\n", iniedit::IniErrorToString(saved.get_error()));
    return 1;
  }
  return 0;
}
