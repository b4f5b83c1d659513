#include "util/Subprocess.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace svcdash::util {

int decode_wait_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

static void close_fd(int& fd) {
  if (fd >= 0) { ::close(fd); fd = -1; }
}

static std::string rtrim(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
  return s;
}

namespace {

struct Pipes {
  int out[2]{-1, -1};
  int err[2]{-1, -1};
  int status[2]{-1, -1};  // exec failure report (CLOEXEC: closes on successful exec)
  ~Pipes() {
    for (int* p : {out, err, status}) { close_fd(p[0]); close_fd(p[1]); }
  }
};

// fork + exec with stdout/stderr on fresh pipes. On return the caller owns
// the read ends left in `p.out[0]` / `p.err[0]`.
pid_t fork_exec(const std::vector<std::string>& argv, Pipes& p) {
  if (argv.empty()) throw std::system_error(EINVAL, std::generic_category(), "spawn: empty argv");
  if (::pipe2(p.out, O_CLOEXEC) != 0 || ::pipe2(p.err, O_CLOEXEC) != 0 || ::pipe2(p.status, O_CLOEXEC) != 0)
    throw std::system_error(errno, std::generic_category(), "spawn: pipe2");

  // Everything the child touches is prepared before fork
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) throw std::system_error(errno, std::generic_category(), "spawn: fork");
  if (pid == 0) {
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) { ::dup2(devnull, STDIN_FILENO); ::close(devnull); }
    ::dup2(p.out[1], STDOUT_FILENO);
    ::dup2(p.err[1], STDERR_FILENO);
    ::setpgid(0, 0);
    ::execvp(cargv[0], cargv.data());
    int e = errno;
    if (::write(p.status[1], &e, sizeof(e)) < 0) { /* nothing left to report to */ }
    _exit(127);
  }

  close_fd(p.out[1]);
  close_fd(p.err[1]);
  close_fd(p.status[1]);
  int child_errno = 0;
  ssize_t n;
  do { n = ::read(p.status[0], &child_errno, sizeof(child_errno)); } while (n < 0 && errno == EINTR);
  if (n == (ssize_t)sizeof(child_errno)) {
    int st = 0;
    while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
    throw std::system_error(child_errno, std::generic_category(), "exec " + argv[0]);
  }
  return pid;
}

} // namespace

ExecResult run_capture(const std::vector<std::string>& argv) {
  Pipes p;
  pid_t pid = fork_exec(argv, p);
  ExecResult r;
  struct pollfd fds[2] = {{p.out[0], POLLIN, 0}, {p.err[0], POLLIN, 0}};
  std::string* sinks[2] = {&r.out, &r.err};
  int open_count = 2;
  char buf[4096];
  while (open_count > 0) {
    int rv = ::poll(fds, 2, -1);
    if (rv < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
      if (n > 0) { sinks[i]->append(buf, (size_t)n); continue; }
      if (n < 0 && errno == EINTR) continue;
      fds[i].fd = -1;
      --open_count;
    }
  }
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) { status = -1; break; }
  }
  r.code = status < 0 ? -1 : decode_wait_status(status);
  r.out = rtrim(std::move(r.out));
  r.err = rtrim(std::move(r.err));
  return r;
}

Child spawn_piped(const std::vector<std::string>& argv) {
  Pipes p;
  pid_t pid = fork_exec(argv, p);
  for (int fd : {p.out[0], p.err[0]}) {
    int fl = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, fl | O_NONBLOCK);
  }
  Child c(pid, p.out[0], p.err[0]);
  p.out[0] = -1;
  p.err[0] = -1;
  return c;
}

Child::~Child() { terminate(); }

Child::Child(Child&& o) noexcept : pid_(o.pid_), out_fd_(o.out_fd_), err_fd_(o.err_fd_) {
  o.pid_ = -1; o.out_fd_ = -1; o.err_fd_ = -1;
}

Child& Child::operator=(Child&& o) noexcept {
  if (this != &o) {
    terminate();
    pid_ = o.pid_; out_fd_ = o.out_fd_; err_fd_ = o.err_fd_;
    o.pid_ = -1; o.out_fd_ = -1; o.err_fd_ = -1;
  }
  return *this;
}

void Child::close_out() { close_fd(out_fd_); }
void Child::close_err() { close_fd(err_fd_); }

std::optional<int> Child::try_wait() {
  if (pid_ <= 0) return std::nullopt;
  int status = 0;
  pid_t r = ::waitpid(pid_, &status, WNOHANG);
  if (r == pid_) {
    pid_ = -1;
    return decode_wait_status(status);
  }
  if (r < 0 && errno == ECHILD) {
    pid_ = -1;
    return -1;
  }
  return std::nullopt;
}

void Child::terminate(std::chrono::milliseconds grace) {
  if (pid_ > 0) {
    // The child leads its own process group; signal the group so helpers die too
    ::kill(-pid_, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (pid_ > 0 && !try_wait() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (pid_ > 0) {
      ::kill(-pid_, SIGKILL);
      int status = 0;
      while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
      pid_ = -1;
    }
  }
  release();
}

void Child::release() {
  close_fd(out_fd_);
  close_fd(err_fd_);
}

} // namespace svcdash::util
