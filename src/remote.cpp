#include "jobtree/remote.hpp"

#include "jobtree/errors.hpp"
#include "jobtree/log.hpp"
#include "jobtree/refs.hpp"
#include "jobtree/repo.hpp"
#include "jobtree/util.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace stdfs = std::filesystem;

namespace {

// Copy all loose objects missing in dst from src.
auto copy_missing_objects(const stdfs::path &src_obj, const stdfs::path &dst_obj)
    -> std::size_t {
  std::size_t copied = 0;
  for (auto it = stdfs::recursive_directory_iterator(src_obj);
       it != stdfs::recursive_directory_iterator(); ++it) {
    if (!it->is_regular_file()) {
      continue;
    }
    const stdfs::path rel = stdfs::relative(it->path(), src_obj);
    const stdfs::path out = dst_obj / rel;
    if (stdfs::exists(out)) {
      continue;
    }
    stdfs::create_directories(out.parent_path());
    // Copy to a temp name first so a concurrent reader never sees half an object.
    const stdfs::path tmp = out.string() + ".tmp";
    stdfs::copy_file(it->path(), tmp, stdfs::copy_options::overwrite_existing);
    stdfs::rename(tmp, out);
    ++copied;
  }
  return copied;
}

} // namespace

namespace jobtree::remote {

void publish_branch(const Repository &local, const stdfs::path &remote,
                    const std::string &branch) {
  const Repository rremote{remote};
  if (!rremote.is_initialized()) {
    throw PushFailure("remote is not a jobtree store: " + remote.string());
  }

  const std::string refname = heads_ref(branch);
  try {
    const auto local_tip = read_ref(local, refname);
    if (!local_tip) {
      throw PushFailure("local branch has no tip: " + branch);
    }
    const auto remote_tip = read_ref(rremote, refname);
    if (remote_tip && !local.is_commit_ancestor(*remote_tip, *local_tip)) {
      throw PushFailure("non-fast-forward update of " + branch + " rejected");
    }

    const auto copied = copy_missing_objects(local.objects_dir(), rremote.objects_dir());
    update_ref(rremote, refname, *local_tip);
    log::info(log::tag::kRemote, "published ", branch, " (", strutil::abbrev(*local_tip),
              ") to ", remote.string(), ", ", copied, " object(s) copied");
  } catch (const PushFailure &) {
    throw;
  } catch (const std::exception &e) {
    throw PushFailure("push of " + branch + " to " + remote.string() + " failed: " + e.what());
  }
}

} // namespace jobtree::remote
