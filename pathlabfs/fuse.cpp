/*
 * Copyright (c) 2026 Jonas 'Sortie' Termansen.
 *
 * Permission to use, copy, modify, and distribute this software for any
 * purpose with or without fee is hereby granted, provided that the above
 * copyright notice and this permission notice appear in all copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
 * WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
 * MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
 * ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
 * WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN
 * ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
 * OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
 *
 * fuse.cpp
 * FUSE frontend.
 */

#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>

#include <err.h>
#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#define FUSE_USE_VERSION 26
#include <fuse.h>

#include <pathlab/accessor.h>
#include <pathlab/creator.h>
#include <pathlab/path.h>
#include <pathlab/stat.h>
#include <pathlab/stream.h>

#include "fuse.h"
#include "pathlabfs.h"

using namespace Pathlab;

struct pathlabfs_fuse_ctx
{
	Accessor* accessor;
	const char* pretend_mount_path;
	bool writable;
	bool verbose;
};

#define FUSE_CTX ((struct pathlabfs_fuse_ctx*) (fuse_get_context()->private_data))
#define FUSE_ACCESSOR (FUSE_CTX->accessor)

static int pathlabfs_fuse_fail(const char* operation, const char* path)
{
	int errnum = errno;
	struct pathlabfs_fuse_ctx* ctx = FUSE_CTX;
	if ( ctx->verbose )
	{
		const char* error_path = ctx->accessor->ErrorPath();
		if ( error_path && path && strcmp(error_path, path) != 0 )
			warnx("%s: %s: %s: %s (%s)", ctx->pretend_mount_path, operation,
			      path, strerror(errnum), error_path);
		else
			warnx("%s: %s: %s: %s", ctx->pretend_mount_path, operation,
			      path ? path : "", strerror(errnum));
	}
	return -(errno = errnum);
}

void* pathlabfs_fuse_init(struct fuse_conn_info* /*conn*/)
{
	return fuse_get_context()->private_data;
}

void pathlabfs_fuse_destroy(void* fs_private)
{
	struct pathlabfs_fuse_ctx* pathlabfs_fuse_ctx =
		(struct pathlabfs_fuse_ctx*) fs_private;
	delete pathlabfs_fuse_ctx->accessor; pathlabfs_fuse_ctx->accessor = NULL;
}

int pathlabfs_fuse_getattr(const char* path, struct stat* st)
{
	StatRecord record;
	if ( !FUSE_ACCESSOR->LStat(path, &record) )
		return pathlabfs_fuse_fail("getattr", path);
	StatRecordToHost(&record, st);
	return 0;
}

int pathlabfs_fuse_readlink(const char* path, char* buf, size_t bufsize)
{
	if ( !bufsize )
		return -(errno = EINVAL);
	char* target = FUSE_ACCESSOR->ReadLink(path);
	if ( !target )
		return pathlabfs_fuse_fail("readlink", path);
	size_t length = strlen(target);
	if ( bufsize - 1 < length )
		length = bufsize - 1;
	memcpy(buf, target, length);
	buf[length] = '\0';
	free(target);
	return 0;
}

int pathlabfs_fuse_mkdir(const char* path, mode_t mode)
{
	if ( !FUSE_CTX->writable )
		return -(errno = EROFS);
	if ( !FUSE_ACCESSOR->Mkdir(path, mode & 07777) )
		return pathlabfs_fuse_fail("mkdir", path);
	return 0;
}

int pathlabfs_fuse_unlink(const char* path)
{
	if ( !FUSE_CTX->writable )
		return -(errno = EROFS);
	if ( !FUSE_ACCESSOR->Unlink(path) )
		return pathlabfs_fuse_fail("unlink", path);
	return 0;
}

int pathlabfs_fuse_rmdir(const char* path)
{
	if ( !FUSE_CTX->writable )
		return -(errno = EROFS);
	if ( !FUSE_ACCESSOR->Rmdir(path) )
		return pathlabfs_fuse_fail("rmdir", path);
	return 0;
}

int pathlabfs_fuse_symlink(const char* oldname, const char* newname)
{
	if ( !FUSE_CTX->writable )
		return -(errno = EROFS);
	if ( !FUSE_ACCESSOR->Symlink(oldname, newname) )
		return pathlabfs_fuse_fail("symlink", newname);
	return 0;
}

int pathlabfs_fuse_rename(const char* oldname, const char* newname)
{
	if ( !FUSE_CTX->writable )
		return -(errno = EROFS);
	if ( !FUSE_ACCESSOR->Replace(oldname, newname) )
		return pathlabfs_fuse_fail("rename", oldname);
	return 0;
}

int pathlabfs_fuse_chmod(const char* path, mode_t mode)
{
	if ( !FUSE_CTX->writable )
		return -(errno = EROFS);
	if ( !FUSE_ACCESSOR->Chmod(path, mode & 07777) )
		return pathlabfs_fuse_fail("chmod", path);
	return 0;
}

// Stages the current contents of a file so it can be modified in memory and
// written back when released.
static Creator* pathlabfs_fuse_stage(const char* path, bool keep_contents,
                                     uint32_t permissions)
{
	Accessor* accessor = FUSE_ACCESSOR;
	uint8_t* data = NULL;
	ssize_t size = 0;
	if ( keep_contents )
	{
		Stream* stream = accessor->Open(path, OPEN_READ);
		if ( !stream )
			return NULL;
		size = stream->ReadAll(&data);
		int errnum = errno;
		delete stream;
		if ( size < 0 )
			return errno = errnum, (Creator*) NULL;
	}
	Creator* creator = Creator::Open(accessor, path, TARGET_IGNORE,
	                                 PARENT_RAISE, permissions);
	if ( !creator )
		return free(data), (Creator*) NULL;
	if ( size && creator->Write(data, (size_t) size) != size )
	{
		int errnum = errno;
		free(data);
		delete creator;
		return errno = errnum, (Creator*) NULL;
	}
	free(data);
	return creator;
}

int pathlabfs_fuse_truncate(const char* path, off_t size)
{
	if ( !FUSE_CTX->writable )
		return -(errno = EROFS);
	if ( size < 0 )
		return -(errno = EINVAL);
	StatRecord record;
	if ( !FUSE_ACCESSOR->Stat(path, &record) )
		return pathlabfs_fuse_fail("truncate", path);
	if ( record.type == FILE_TYPE_DIR )
		return -(errno = EISDIR);
	Creator* creator = pathlabfs_fuse_stage(path, size != 0,
	                                        record.permissions);
	if ( !creator )
		return pathlabfs_fuse_fail("truncate", path);
	if ( !creator->Truncate((size_t) size) || !creator->Close() )
	{
		int result = pathlabfs_fuse_fail("truncate", path);
		delete creator;
		return result;
	}
	delete creator;
	return 0;
}

int pathlabfs_fuse_ftruncate(const char* path, off_t size,
                             struct fuse_file_info* fi)
{
	Stream* stream = (Stream*) (uintptr_t) fi->fh;
	if ( size < 0 )
		return -(errno = EINVAL);
	if ( !stream->Writable() )
		return -(errno = EBADF);
	if ( !((BufferStream*) stream)->Truncate((size_t) size) )
		return pathlabfs_fuse_fail("ftruncate", path);
	return 0;
}

int pathlabfs_fuse_open(const char* path, struct fuse_file_info* fi)
{
	int flags = fi->flags;
	Stream* stream;
	if ( (flags & O_ACCMODE) == O_RDONLY )
		stream = FUSE_ACCESSOR->Open(path, OPEN_READ);
	else if ( !FUSE_CTX->writable )
		return -(errno = EROFS);
	else
	{
		StatRecord record;
		if ( !FUSE_ACCESSOR->Stat(path, &record) )
			return pathlabfs_fuse_fail("open", path);
		if ( record.type == FILE_TYPE_DIR )
			return -(errno = EISDIR);
		stream = pathlabfs_fuse_stage(path, !(flags & O_TRUNC),
		                              record.permissions);
	}
	if ( !stream )
		return pathlabfs_fuse_fail("open", path);
	fi->fh = (uint64_t) (uintptr_t) stream;
	fi->keep_cache = 1;
	return 0;
}

int pathlabfs_fuse_access(const char* path, int /*mode*/)
{
	StatRecord record;
	if ( !FUSE_ACCESSOR->Stat(path, &record) )
		return -errno;
	return 0;
}

int pathlabfs_fuse_create(const char* path, mode_t mode,
                          struct fuse_file_info* fi)
{
	if ( !FUSE_CTX->writable )
		return -(errno = EROFS);
	Creator* creator = Creator::Open(FUSE_ACCESSOR, path, TARGET_IGNORE,
	                                 PARENT_RAISE, mode & 07777);
	if ( !creator )
		return pathlabfs_fuse_fail("create", path);
	fi->fh = (uint64_t) (uintptr_t) creator;
	fi->keep_cache = 1;
	return 0;
}

int pathlabfs_fuse_read(const char* path, char* buf, size_t count,
                        off_t offset, struct fuse_file_info* fi)
{
	Stream* stream = (Stream*) (uintptr_t) fi->fh;
	if ( INT_MAX < count )
		count = INT_MAX;
	if ( stream->Seek(offset, SEEK_SET) < 0 )
		return pathlabfs_fuse_fail("read", path);
	size_t done = 0;
	while ( done < count )
	{
		ssize_t amount = stream->Read(buf + done, count - done);
		if ( amount < 0 )
			return pathlabfs_fuse_fail("read", path);
		if ( amount == 0 )
			break;
		done += amount;
	}
	return (int) done;
}

int pathlabfs_fuse_write(const char* path, const char* buf, size_t count,
                         off_t offset, struct fuse_file_info* fi)
{
	Stream* stream = (Stream*) (uintptr_t) fi->fh;
	if ( !stream->Writable() )
		return -(errno = EBADF);
	if ( INT_MAX < count )
		count = INT_MAX;
	BufferStream* buffer = (BufferStream*) stream;
	if ( offset < 0 )
		return -(errno = EINVAL);
	if ( buffer->Length() < offset && !buffer->Truncate((size_t) offset) )
		return pathlabfs_fuse_fail("write", path);
	if ( buffer->Seek(offset, SEEK_SET) < 0 )
		return pathlabfs_fuse_fail("write", path);
	ssize_t amount = buffer->Write(buf, count);
	if ( amount < 0 )
		return pathlabfs_fuse_fail("write", path);
	return (int) amount;
}

int pathlabfs_fuse_statfs(const char* /*path*/, struct statvfs* stvfs)
{
	memset(stvfs, 0, sizeof(*stvfs));
	stvfs->f_bsize = 4096;
	stvfs->f_frsize = 4096;
	stvfs->f_blocks = 0;
	stvfs->f_bfree = 0;
	stvfs->f_bavail = 0;
	stvfs->f_files = 0;
	stvfs->f_ffree = 0;
	stvfs->f_favail = 0;
	stvfs->f_fsid = 0;
	stvfs->f_flag = FUSE_CTX->writable ? 0 : ST_RDONLY;
	stvfs->f_namemax = 255;
	return 0;
}

int pathlabfs_fuse_flush(const char* /*path*/, struct fuse_file_info* /*fi*/)
{
	return 0;
}

// Staged writes become visible in the archive once the file is released.
int pathlabfs_fuse_release(const char* path, struct fuse_file_info* fi)
{
	Stream* stream = (Stream*) (uintptr_t) fi->fh;
	int result = 0;
	if ( stream->Writable() && !stream->Close() )
		result = pathlabfs_fuse_fail("release", path);
	delete stream;
	fi->fh = 0;
	return result;
}

int pathlabfs_fuse_fsync(const char* /*path*/, int /*data*/,
                         struct fuse_file_info* /*fi*/)
{
	return 0;
}

int pathlabfs_fuse_opendir(const char* path, struct fuse_file_info* /*fi*/)
{
	StatRecord record;
	if ( !FUSE_ACCESSOR->Stat(path, &record) )
		return pathlabfs_fuse_fail("opendir", path);
	if ( record.type != FILE_TYPE_DIR )
		return -(errno = ENOTDIR);
	return 0;
}

int pathlabfs_fuse_readdir(const char* path, void* buf,
                           fuse_fill_dir_t filler, off_t /*rec_num*/,
                           struct fuse_file_info* /*fi*/)
{
	size_t count;
	char** names = FUSE_ACCESSOR->ListDir(path, &count);
	if ( !names )
		return pathlabfs_fuse_fail("readdir", path);
	if ( !filler(buf, ".", NULL, 0) && !filler(buf, "..", NULL, 0) )
	{
		for ( size_t i = 0; i < count; i++ )
			if ( filler(buf, names[i], NULL, 0) )
				break;
	}
	FreeNames(names, count);
	return 0;
}

int pathlabfs_fuse_main(const char* argv0,
                        const char* mount_path,
                        const char* pretend_mount_path,
                        const char* fuse_options,
                        bool foreground,
                        bool writable,
                        bool verbose,
                        Accessor* accessor)
{
	struct fuse_operations operations;
	memset(&operations, 0, sizeof(operations));

	operations.access = pathlabfs_fuse_access;
	operations.chmod = pathlabfs_fuse_chmod;
	operations.create = pathlabfs_fuse_create;
	operations.destroy = pathlabfs_fuse_destroy;
	operations.flush = pathlabfs_fuse_flush;
	operations.fsync = pathlabfs_fuse_fsync;
	operations.ftruncate = pathlabfs_fuse_ftruncate;
	operations.getattr = pathlabfs_fuse_getattr;
	operations.init = pathlabfs_fuse_init;
	operations.mkdir = pathlabfs_fuse_mkdir;
	operations.opendir = pathlabfs_fuse_opendir;
	operations.open = pathlabfs_fuse_open;
	operations.readdir = pathlabfs_fuse_readdir;
	operations.read = pathlabfs_fuse_read;
	operations.readlink = pathlabfs_fuse_readlink;
	operations.release = pathlabfs_fuse_release;
	operations.rename = pathlabfs_fuse_rename;
	operations.rmdir = pathlabfs_fuse_rmdir;
	operations.statfs = pathlabfs_fuse_statfs;
	operations.symlink = pathlabfs_fuse_symlink;
	operations.truncate = pathlabfs_fuse_truncate;
	operations.unlink = pathlabfs_fuse_unlink;
	operations.write = pathlabfs_fuse_write;

	char* argv_fuse[] =
	{
		(char*) argv0,
		(char*) "-ouse_ino",
		(char*) "-o",
		(char*) (fuse_options ? fuse_options : (writable ? "rw" : "ro")),
		(char*) "-s",
		(char*) (foreground ? "-f" : mount_path),
		(char*) (foreground ? mount_path : NULL),
		(char*) NULL,
	};

	int argc_fuse = 0;
	while ( argv_fuse[argc_fuse] )
		argc_fuse++;

	struct pathlabfs_fuse_ctx pathlabfs_fuse_ctx;
	pathlabfs_fuse_ctx.accessor = accessor;
	pathlabfs_fuse_ctx.pretend_mount_path =
		pretend_mount_path ? pretend_mount_path : mount_path;
	pathlabfs_fuse_ctx.writable = writable;
	pathlabfs_fuse_ctx.verbose = verbose;

	return fuse_main(argc_fuse, argv_fuse, &operations, &pathlabfs_fuse_ctx);
}
