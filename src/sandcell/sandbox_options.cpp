#include "sandbox_options.h"

#include <unistd.h>
#include <sys/mount.h>
#include <cstring>
#include <stdexcept>

namespace {

// host byte order; both ends run on the same machine
class Writer {
  std::vector<uint8_t> buf_;
 public:
  void Put(long val) {
    const uint8_t* ptr = reinterpret_cast<const uint8_t*>(&val);
    buf_.insert(buf_.end(), ptr, ptr + sizeof(val));
  }
  void Put(const std::string& str) {
    Put((long)str.size());
    buf_.insert(buf_.end(), str.begin(), str.end());
  }
  void Put(const std::vector<std::string>& strs) {
    Put((long)strs.size());
    for (auto& i : strs) Put(i);
  }
  std::vector<uint8_t> Take() { return std::move(buf_); }
};

class Reader {
  const std::vector<uint8_t>& buf_;
  size_t pos_;

  void Need_(size_t len) {
    if (pos_ + len > buf_.size()) throw std::out_of_range("truncated sandbox options");
  }
 public:
  explicit Reader(const std::vector<uint8_t>& buf) : buf_(buf), pos_(0) {}
  long Long() {
    long val;
    Need_(sizeof(val));
    memcpy(&val, buf_.data() + pos_, sizeof(val));
    pos_ += sizeof(val);
    return val;
  }
  std::string String() {
    long len = Long();
    if (len < 0) throw std::out_of_range("bad string length in sandbox options");
    Need_(len);
    std::string ret((const char*)buf_.data() + pos_, len);
    pos_ += len;
    return ret;
  }
  std::vector<std::string> Strings() {
    std::vector<std::string> ret(Long());
    for (auto& i : ret) i = String();
    return ret;
  }
};

} // namespace

SandboxOptions::SandboxOptions(const std::vector<uint8_t>& vec) {
  Reader in(vec);
  boxdir = in.String();
  command = in.Strings();
  envs = in.Strings();
  workdir = in.String();
  fd_input = in.Long();
  fd_output = in.Long();
  fd_error = in.Long();
  uid = in.Long();
  gid = in.Long();
  wall_time = in.Long();
  rss = in.Long();
  proc_num = in.Long();
  fsize = in.Long();
  share_net = in.Long();
  mounts.resize(in.Long());
  for (auto& i : mounts) {
    i.source = in.String();
    i.target = in.String();
    i.readonly = in.Long();
  }
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  Writer out;
  out.Put(boxdir);
  out.Put(command);
  out.Put(envs);
  out.Put(workdir);
  for (long i : {(long)fd_input, (long)fd_output, (long)fd_error, (long)uid, (long)gid,
                 wall_time, rss, (long)proc_num, fsize, (long)share_net}) {
    out.Put(i);
  }
  out.Put((long)mounts.size());
  for (auto& i : mounts) {
    out.Put(i.source);
    out.Put(i.target);
    out.Put((long)i.readonly);
  }
  return out.Take();
}

CJailCtxClass SandboxOptions::ToCJailCtx() const {
  CJailCtxClass ret;
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd
  if (fd_input != -1) ctx.fd_input = fd_input;
  if (fd_output != -1) ctx.fd_output = fd_output;
  if (fd_error != -1) ctx.fd_error = fd_error;
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  for (auto& i : envs) ret.env_buf_.emplace_back(i.data());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  ctx.chroot = boxdir.data();
  ctx.working_dir = workdir.data();
  // default: cgroup_root
  ctx.cpuset = nullptr;
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  // default: rlim_stack (no limit)
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  // a private network namespace has only a down loopback device
  ctx.sharenet = share_net;
  // default: seccomp_cfg
  // reallocation of str_buf_ invalidate str.data(), thus we need to reserve it first
  ret.str_buf_.reserve(mounts.size());
  ret.mnt_buf_.reserve(mounts.size());
  for (auto& i : mounts) {
    ret.mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = ret.mnt_buf_.back();
    ret.str_buf_.push_back("bind");
    mnt_ctx.type = ret.str_buf_.back().data();
    mnt_ctx.source = i.source.data();
    mnt_ctx.target = i.target.data();
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = i.readonly ? MS_RDONLY : 0;
    mnt_list_add(ret.mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = ret.mnt_list_;
  return ret;
}
