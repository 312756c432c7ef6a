#pragma once

#include <stdint.h>
#include <stddef.h>

/* Scalar types and constants of the kcore kernel ABI. Values of the errno
 * and signal constants follow the Linux/POSIX numbering, so that userland
 * built against a Unix libc can use them unchanged. */

typedef int32_t kcore_pid_t;
typedef int32_t kcore_pgid_t;
typedef int32_t kcore_tid_t;
typedef int32_t kcore_exitcode_t;
typedef uint8_t kcore_signal_t;
typedef uint16_t kcore_errno_t;
typedef uint16_t kcore_mode_t;
typedef int32_t kcore_fd_t;
typedef uint32_t kcore_uid_t;

#define KCORE_ESUCCESS 0
#define KCORE_EPERM 1
#define KCORE_ENOENT 2
#define KCORE_ESRCH 3
#define KCORE_EINTR 4
#define KCORE_EIO 5
#define KCORE_E2BIG 7
#define KCORE_ENOEXEC 8
#define KCORE_EBADF 9
#define KCORE_ECHILD 10
#define KCORE_EAGAIN 11
#define KCORE_ENOMEM 12
#define KCORE_EACCES 13
#define KCORE_EFAULT 14
#define KCORE_EBUSY 16
#define KCORE_EEXIST 17
#define KCORE_ENOTDIR 20
#define KCORE_EINVAL 22
#define KCORE_ENFILE 23
#define KCORE_EMFILE 24
#define KCORE_ENOSPC 28
#define KCORE_ERANGE 34
#define KCORE_ENAMETOOLONG 36
#define KCORE_ENOSYS 38

#define KCORE_SIGHUP 1
#define KCORE_SIGINT 2
#define KCORE_SIGQUIT 3
#define KCORE_SIGILL 4
#define KCORE_SIGTRAP 5
#define KCORE_SIGABRT 6
#define KCORE_SIGBUS 7
#define KCORE_SIGFPE 8
#define KCORE_SIGKILL 9
#define KCORE_SIGUSR1 10
#define KCORE_SIGSEGV 11
#define KCORE_SIGUSR2 12
#define KCORE_SIGPIPE 13
#define KCORE_SIGALRM 14
#define KCORE_SIGTERM 15
#define KCORE_SIGSTKFLT 16
#define KCORE_SIGCHLD 17
#define KCORE_SIGCONT 18
#define KCORE_SIGSTOP 19
#define KCORE_SIGTSTP 20
#define KCORE_SIGTTIN 21
#define KCORE_SIGTTOU 22
#define KCORE_SIGURG 23
#define KCORE_SIGXCPU 24
#define KCORE_SIGXFSZ 25
#define KCORE_SIGVTALRM 26
#define KCORE_SIGPROF 27
#define KCORE_SIGWINCH 28
#define KCORE_SIGIO 29
#define KCORE_SIGPWR 30
#define KCORE_SIGSYS 31
#define KCORE_SIGRTMIN 32
#define KCORE_SIGRTMAX 64

/* wait options */
#define KCORE_WNOHANG 1

#define KCORE_INIT_PID 1
