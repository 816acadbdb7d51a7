#include "markdown.hpp"
#include "file_reader.hpp"
#include <cassert>
#include <filesystem>
#include <string>
#include <unistd.h>

static void test_fences() {
  std::string ok = "# T\n\n```bash\necho hi\n```\n\n```yaml\na: 1\n```\n";
  auto fs = collect_fences(ok);
  assert(fs.size() == 2);
  assert(fs[0].lang == "bash" && fs[0].open_line == 2 && fs[0].close_line == 4);
  assert(fs[1].lang == "yaml");
  assert(fences_well_formed(ok));

  assert(!fences_well_formed("```bash\necho unterminated\n"));
  assert(!fences_well_formed("```\nno tag\n```\n"));
  assert(!fences_well_formed("```python\nprint(1)\n```\n"));
  assert(fences_well_formed("no fences at all"));
}

static void test_heading_and_slug() {
  std::string doc = "I'll help.\n\n```bash\n# not a heading\n```\n\n# Deploy Application to Kubernetes\n\n## Step 1\n";
  assert(first_heading(doc) == "Deploy Application to Kubernetes");
  assert(slugify(first_heading(doc)) == "deploy-application-to-kubernetes");
  assert(slugify("  Manage ConfigMaps & Secrets!! ") == "manage-configmaps-secrets");
  assert(slugify("") == "document");
  assert(first_heading("plain text") == "");
}

static void test_export_roundtrip() {
  auto dir = std::filesystem::temp_directory_path() / ("ieassist_md_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  std::string doc = "Here you go:\n\n# Create Kubernetes Service\n\n```bash\nkubectl get services\n```";

  auto p1 = export_path_for(dir, doc);
  assert(p1.filename() == "create-kubernetes-service.md");
  std::string msg;
  assert(write_document(p1, doc, msg));
  assert(msg.find("saved document") != std::string::npos);
  assert(!std::filesystem::exists(p1.string() + ".tmp"));

  std::vector<std::string> lines;
  assert(read_lines(p1, lines, msg));
  assert(lines.front() == "# Create Kubernetes Service");
  assert(lines.back() == "```");

  auto p2 = export_path_for(dir, doc);
  assert(p2.filename() == "create-kubernetes-service-2.md");

  std::string fail_msg;
  assert(!write_document(dir / "missing-subdir" / "x.md", doc, fail_msg));
  assert(fail_msg.find("save failed") != std::string::npos);

  std::filesystem::remove_all(dir);
}

int main() {
  test_fences();
  test_heading_and_slug();
  test_export_roundtrip();
  return 0;
}
