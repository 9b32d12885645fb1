#ifndef SANDCELL_SANDBOX_OPTIONS_H_
#define SANDCELL_SANDBOX_OPTIONS_H_

#include <string>
#include <vector>
#include <cstdint>
#include <utility>

#include <cjail/cjail.h>

// This header is shared with sandcell-sandbox-exec; keep it free of logging
// and other library dependencies.

class SandboxOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<std::string> str_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  // vector moves keep element addresses, so pointers in ctx_ stay valid
  CJailCtxClass(CJailCtxClass&& x) :
      argv_buf_(std::move(x.argv_buf_)),
      env_buf_(std::move(x.env_buf_)),
      str_buf_(std::move(x.str_buf_)),
      mnt_buf_(std::move(x.mnt_buf_)),
      mnt_list_(x.mnt_list_),
      ctx_(x.ctx_) {
    x.mnt_list_ = nullptr;
  }
  CJailCtxClass(const CJailCtxClass&) = delete;
  ~CJailCtxClass() {
    if (mnt_list_) mnt_list_free(mnt_list_);
  }
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class SandboxOptions;
};

class SandboxOptions {
 public:
  struct Mount {
    std::string source; // host
    std::string target; // relative to boxdir but start with /
    bool readonly;
  };

  std::string boxdir;
  std::vector<std::string> command;
  std::vector<std::string> envs; // KEY=VALUE
  std::string workdir; // inside box
  int fd_input, fd_output, fd_error; // -1 for not dup
  int uid, gid;
  long wall_time; // us
  long rss; // KiB
  int proc_num;
  long fsize; // KiB
  bool share_net;
  std::vector<Mount> mounts;

  SandboxOptions() :
      fd_input(-1), fd_output(-1), fd_error(-1),
      uid(65534), gid(65534),
      wall_time(0),
      rss(0),
      proc_num(0),
      fsize(0),
      share_net(false) {}
  // throws std::out_of_range on truncated input
  explicit SandboxOptions(const std::vector<uint8_t>& serial);

  // platform dependent, only intended for same machine
  std::vector<uint8_t> Serialize() const;
  // the result is invalidated after reassignment/reallocation of any string/vector member
  CJailCtxClass ToCJailCtx() const;
};

#endif  // SANDCELL_SANDBOX_OPTIONS_H_
