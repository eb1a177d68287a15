#include "storyflow/scaffold.hpp"

#include "storyflow/fs.hpp"
#include "storyflow/util.hpp"

#include <algorithm>

namespace stdfs = std::filesystem;

namespace storyflow {

std::string substitute(std::string text, const ScaffoldVars &vars) {
  text = strutil::replace_all(std::move(text), "{{story_id}}", vars.story_id);
  text = strutil::replace_all(std::move(text), "{{title}}", vars.title);
  text = strutil::replace_all(std::move(text), "{{branch}}", vars.branch);
  text = strutil::replace_all(std::move(text), "{{project}}", vars.project);
  text = strutil::replace_all(std::move(text), "{{remote}}", vars.remote);
  return text;
}

TemplateDirRenderer::TemplateDirRenderer(stdfs::path templates_dir)
    : dir_(std::move(templates_dir)) {}

Result<std::vector<ScaffoldFile>> TemplateDirRenderer::render(const ScaffoldVars &vars) {
  std::vector<ScaffoldFile> files;
  if (fs::exists(dir_)) {
    try {
      for (const auto &entry : stdfs::recursive_directory_iterator(dir_)) {
        if (!entry.is_regular_file())
          continue;
        auto rel = entry.path().lexically_relative(dir_);
        // "name.tmpl" renders to "name"
        if (rel.extension() == ".tmpl")
          rel.replace_extension();
        files.push_back(ScaffoldFile{.relative = std::move(rel),
                                     .content = substitute(fs::read_text(entry.path()), vars)});
      }
    } catch (const std::exception &e) {
      return make_error(ErrorKind::Io, std::string("rendering templates: ") + e.what());
    }
  }
  if (files.empty()) {
    files.push_back(ScaffoldFile{.relative = "story.md", .content = vars.story_text});
    files.push_back(ScaffoldFile{
        .relative = "context",
        .content = substitute("story_id: {{story_id}}\ntitle: {{title}}\nbranch: {{branch}}\n"
                              "project: {{project}}\nremote: {{remote}}\n",
                              vars)});
  }
  std::ranges::sort(files, [](const ScaffoldFile &a, const ScaffoldFile &b) {
    return a.relative.string() < b.relative.string();
  });
  return files;
}

} // namespace storyflow
