#include "storyflow/story.hpp"

#include "storyflow/consts.hpp"
#include "storyflow/fs.hpp"
#include "storyflow/time.hpp"
#include "storyflow/util.hpp"

#include <algorithm>
#include <sstream>

namespace stdfs = std::filesystem;

namespace storyflow {

bool is_valid_story_id(std::string_view id) {
  if (id.empty() || id.front() == '.' || id.front() == '-')
    return false;
  return std::ranges::none_of(id, [](char c) {
    return c == '/' || c == '\\' || c == '\0' || c == ' ' || c == '\n';
  });
}

std::optional<long long> story_number(std::string_view id) {
  const auto dash = id.rfind('-');
  if (dash == std::string_view::npos)
    return std::nullopt;
  return strutil::parse_int(id.substr(dash + 1));
}

std::string render_story(const std::string &id, const StoryDraft &draft,
                         std::string_view created_at) {
  std::ostringstream os;
  os << "# " << id << ": " << draft.title << "\n\n";
  os << consts::kCreatedPrefix << created_at << "\n";
  if (draft.repository) {
    os << consts::kRepoPrefix << draft.repository->url << "\n";
    if (!draft.repository->branch_strategy.empty())
      os << consts::kStrategyPrefix << draft.repository->branch_strategy << "\n";
  }
  os << "\n## Description\n\n"
     << (draft.description.empty() ? std::string("No description provided.") : draft.description)
     << "\n\n"
     << "## Acceptance Criteria\n\n"
     << "- [ ] Define acceptance criteria for this story\n\n"
     << "## Notes\n\n"
     << "<!-- Add any additional notes or updates here -->\n\n"
     << "## Related Issues\n\n"
     << "<!-- Link to any related issues or stories -->\n";
  return os.str();
}

Story parse_story(std::string_view id, std::string_view text) {
  Story s;
  s.id = std::string(id);
  s.title = s.id;
  std::istringstream iss{std::string(text)};
  std::string line;
  bool have_title = false;
  bool in_description = false;
  std::string description;
  while (std::getline(iss, line)) {
    strutil::rstrip_newlines(line);
    if (!have_title && line.rfind("# ", 0) == 0) {
      const std::string heading = strutil::trim(std::string_view(line).substr(2));
      const auto sep = heading.find(": ");
      s.title = sep == std::string::npos ? heading : heading.substr(sep + 2);
      have_title = true;
      continue;
    }
    if (line.rfind("## ", 0) == 0) {
      in_description = line == "## Description";
      continue;
    }
    if (in_description) {
      description += line + "\n";
      continue;
    }
    std::string_view sv{line};
    if (sv.starts_with(consts::kCreatedPrefix)) {
      s.created_at = strutil::trim(sv.substr(consts::kCreatedPrefix.size()));
    } else if (sv.starts_with(consts::kRepoPrefix)) {
      if (!s.repository)
        s.repository = RepositoryRef{};
      s.repository->url = strutil::trim(sv.substr(consts::kRepoPrefix.size()));
    } else if (sv.starts_with(consts::kStrategyPrefix)) {
      if (!s.repository)
        s.repository = RepositoryRef{};
      s.repository->branch_strategy = strutil::trim(sv.substr(consts::kStrategyPrefix.size()));
    }
  }
  description = strutil::trim(description);
  while (!description.empty() && description.back() == '\n')
    description.pop_back();
  while (!description.empty() && description.front() == '\n')
    description.erase(description.begin());
  if (description != "No description provided.")
    s.description = description;
  if (s.repository && s.repository->url.empty())
    s.repository.reset();
  return s;
}

StoryRegistry::StoryRegistry(Project &project, std::chrono::milliseconds lock_timeout)
    : project_(project), lock_timeout_(lock_timeout) {}

auto StoryRegistry::file_for(std::string_view id) const -> stdfs::path {
  return project_.stories_dir() / (std::string(id) + std::string(consts::kStoryExt));
}

bool StoryRegistry::exists(std::string_view id) const { return fs::exists(file_for(id)); }

auto StoryRegistry::allocate_id(Context &ctx) -> Result<std::string> {
  for (;;) {
    auto n = project_.bump_story_number(lock_timeout_);
    if (!n)
      return std::move(n.error());
    std::string id = project_.config().prefix + "-" + std::to_string(n.value());
    // a hand-made file may already use the number; never hand it out twice
    if (!exists(id)) {
      ctx.log().debug("allocated story id {}", id);
      return id;
    }
    ctx.log().warn("story file for {} already exists; skipping number", id);
  }
}

auto StoryRegistry::create(Context &ctx, const std::string &id, const StoryDraft &draft)
    -> Result<Story> {
  if (!is_valid_story_id(id))
    return make_error(ErrorKind::Validation, "invalid story id '" + id + "'");
  if (strutil::trim(draft.title).empty())
    return make_error(ErrorKind::Validation, "story title must not be empty");
  const auto created_at = timeutil::now_iso8601();
  const auto text = render_story(id, draft, created_at);
  try {
    if (!fs::create_exclusive(file_for(id), text)) {
      return make_error(ErrorKind::StateConflict, "story " + id + " already exists");
    }
  } catch (const std::exception &e) {
    return make_error(ErrorKind::Io, e.what());
  }
  ctx.log().info("created story {}: {}", id, draft.title);
  Story s = parse_story(id, text);
  s.file = file_for(id);
  return s;
}

auto StoryRegistry::load(std::string_view id) const -> Result<Story> {
  if (!is_valid_story_id(id))
    return make_error(ErrorKind::Validation, "invalid story id '" + std::string(id) + "'");
  const auto file = file_for(id);
  if (!fs::exists(file))
    return make_error(ErrorKind::NotFound, "story " + std::string(id) + " not found");
  try {
    Story s = parse_story(id, fs::read_text(file));
    s.file = file;
    return s;
  } catch (const std::exception &e) {
    return make_error(ErrorKind::Io, e.what());
  }
}

auto StoryRegistry::discover() const -> StoryIndex {
  StoryIndex index;
  std::error_code ec;
  stdfs::directory_iterator it(project_.stories_dir(), ec);
  if (ec) {
    index.problems.push_back(make_error(ErrorKind::Io, "cannot read " +
                                                           project_.stories_dir().string() +
                                                           ": " + ec.message()));
    return index;
  }
  for (const auto &entry : it) {
    const auto &p = entry.path();
    if (p.extension() != consts::kStoryExt || p.filename().string().front() == '.')
      continue;
    auto story = load(p.stem().string());
    if (story)
      index.stories.push_back(std::move(story).value());
    else
      index.problems.push_back(std::move(story.error()));
  }
  std::ranges::sort(index.stories, [](const Story &a, const Story &b) {
    const auto na = story_number(a.id);
    const auto nb = story_number(b.id);
    if (na && nb && *na != *nb)
      return *na < *nb;
    return a.id < b.id;
  });
  return index;
}

auto StoryRegistry::remove(Context &ctx, std::string_view id) -> Result<void> {
  try {
    if (!fs::remove_entry(file_for(id)))
      return make_error(ErrorKind::NotFound, "story " + std::string(id) + " not found");
  } catch (const std::exception &e) {
    return make_error(ErrorKind::Io, e.what());
  }
  ctx.log().info("removed story file for {}", id);
  return {};
}

} // namespace storyflow
