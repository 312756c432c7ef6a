#pragma once

#include <abi/kcore_types.h>

#ifdef TESTING_ENABLED
/* pull in the host's definitions once, so the kernel names below win */
#include <errno.h>
#undef EPERM
#undef ENOENT
#undef ESRCH
#undef EINTR
#undef EIO
#undef E2BIG
#undef ENOEXEC
#undef EBADF
#undef ECHILD
#undef EAGAIN
#undef ENOMEM
#undef EACCES
#undef EFAULT
#undef EBUSY
#undef EEXIST
#undef ENOTDIR
#undef EINVAL
#undef ENFILE
#undef EMFILE
#undef ENOSPC
#undef ERANGE
#undef ENAMETOOLONG
#undef ENOSYS
#endif

#define EPERM KCORE_EPERM
#define ENOENT KCORE_ENOENT
#define ESRCH KCORE_ESRCH
#define EINTR KCORE_EINTR
#define EIO KCORE_EIO
#define E2BIG KCORE_E2BIG
#define ENOEXEC KCORE_ENOEXEC
#define EBADF KCORE_EBADF
#define ECHILD KCORE_ECHILD
#define EAGAIN KCORE_EAGAIN
#define ENOMEM KCORE_ENOMEM
#define EACCES KCORE_EACCES
#define EFAULT KCORE_EFAULT
#define EBUSY KCORE_EBUSY
#define EEXIST KCORE_EEXIST
#define ENOTDIR KCORE_ENOTDIR
#define EINVAL KCORE_EINVAL
#define ENFILE KCORE_ENFILE
#define EMFILE KCORE_EMFILE
#define ENOSPC KCORE_ENOSPC
#define ERANGE KCORE_ERANGE
#define ENAMETOOLONG KCORE_ENAMETOOLONG
#define ENOSYS KCORE_ENOSYS
