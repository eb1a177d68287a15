#pragma once
#include "storyflow/error.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace storyflow {

struct ScaffoldVars {
  std::string story_id;
  std::string title;
  std::string branch;
  std::string project;
  std::string remote; // redacted
  std::string story_text;
};

struct ScaffoldFile {
  std::filesystem::path relative; // under <workspace>/.storyflow/
  std::string content;
};

// Produces the files placed next to a story's working tree.
class ScaffoldRenderer {
public:
  virtual ~ScaffoldRenderer() = default;
  virtual auto render(const ScaffoldVars& vars) -> Result<std::vector<ScaffoldFile>> = 0;
};

// Renders every regular file under a template directory, substituting
// {{story_id}}, {{title}}, {{branch}}, {{project}} and {{remote}}. Without
// templates it writes story.md and a context file.
class TemplateDirRenderer : public ScaffoldRenderer {
public:
  explicit TemplateDirRenderer(std::filesystem::path templates_dir);
  auto render(const ScaffoldVars& vars) -> Result<std::vector<ScaffoldFile>> override;

private:
  std::filesystem::path dir_;
};

auto substitute(std::string text, const ScaffoldVars& vars) -> std::string;

} // namespace storyflow
