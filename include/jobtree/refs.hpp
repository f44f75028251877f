#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobtree {

class Repository; // fwd

// "refs/heads/<branch>"
std::string heads_ref(std::string_view branch);

// HEAD is per worktree ("ref: refs/heads/master\n" or a 40-hex id);
// std::nullopt if it does not exist yet.
std::optional<std::string> read_HEAD(const Repository &repo);
void set_HEAD_symbolic(const Repository &repo, const std::string &refname);
void set_HEAD_detached(const Repository &repo, std::string_view hex_oid);

// Refs live in the shared store, visible from every linked worktree.
std::optional<std::string> read_ref(const Repository &repo, const std::string &refname);
void update_ref(const Repository &repo, const std::string &refname, const std::string &hex_oid);
bool delete_ref(const Repository &repo, const std::string &refname);

// Branch names (without "refs/heads/") starting with `prefix`, sorted.
std::vector<std::string> list_branches(const Repository &repo, std::string_view prefix = {});

} // namespace jobtree
