#include <errno.h>
#include <unistd.h>
#include <stdexcept>

#include "sandbox_options.h"

// sandcell-sandbox-exec: reads serialized SandboxOptions from stdin, runs it
// with cjail and writes the raw cjail_result to stdout

namespace {

bool ReadAll(int fd, void* buf, size_t size) {
  for (size_t done = 0; done < size;) {
    ssize_t ret = read(fd, (char*)buf + done, size - done);
    if (ret < 0 && errno == EINTR) continue;
    if (ret <= 0) return false;
    done += ret;
  }
  return true;
}

struct cjail_result Exec(const SandboxOptions& opt) {
  CJailCtxClass ctx = opt.ToCJailCtx();
  struct cjail_result ret = {};
  if (cjail_exec(&ctx.GetCtx(), &ret) < 0) {
    ret.oomkill = errno;
    ret.timekill = -1;
  }
  return ret;
}

} // namespace

int main() {
  long sz = 0;
  if (!ReadAll(0, &sz, sizeof(sz)) || sz < 0) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(0, buf.data(), sz)) return 1;
  struct cjail_result res;
  try {
    res = Exec(SandboxOptions(buf));
  } catch (const std::out_of_range&) {
    return 1;
  }
  if (write(1, &res, sizeof(res)) != sizeof(res)) return 1;
}
