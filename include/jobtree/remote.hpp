#pragma once
#include <filesystem>
#include <string>

namespace jobtree {

class Repository; // fwd

namespace remote {

// Push `refs/heads/<branch>` of `local` into the store rooted at `remote`
// (fast-forward only): missing loose objects are copied, then the remote ref
// is set. Any failure is reported as PushFailure.
void publish_branch(const Repository &local, const std::filesystem::path &remote,
                    const std::string &branch);

} // namespace remote

} // namespace jobtree
