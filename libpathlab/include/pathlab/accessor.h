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
 * pathlab/accessor.h
 * Capability contract implemented by every storage backend.
 */

#ifndef INCLUDE_PATHLAB_ACCESSOR_H
#define INCLUDE_PATHLAB_ACCESSOR_H

#include <errno.h>
#include <stddef.h>
#include <stdint.h>

#include <pathlab/path.h>
#include <pathlab/stat.h>

namespace Pathlab {

class Stream;

enum OpenMode
{
	OPEN_READ,
	OPEN_WRITE,
};

static const size_t SYMLINK_FOLLOW_MAX = 40;

class Accessor
{
public:
	Accessor();
	virtual ~Accessor();

private:
	Accessor(const Accessor&);
	Accessor& operator=(const Accessor&);

public:
	// Streams are always fully buffered, a buffering other than -1 fails with
	// ENOTSUP.
	virtual Stream* Open(const char* path, int mode, int buffering = -1) = 0;
	virtual char** ListDir(const char* path, size_t* count_out) = 0;
	virtual bool Stat(const char* path, StatRecord* st,
	                  bool follow_symlinks = true);
	virtual char* ReadLink(const char* path);

public:
	// Optional operations. The defaults fail with ENOTSUP. Move replaces an
	// existing destination.
	virtual bool Create(const char* path, const StatRecord* st,
	                    Stream* content);
	virtual bool Move(const char* path, const char* dest);
	virtual bool Delete(const char* path);
	virtual bool Chmod(const char* path, uint32_t mode,
	                   bool follow_symlinks = true);

public:
	VirtualPath Root();
	VirtualPath MakePath(const char* path);
	VirtualPath* ScanDir(const char* path, size_t* count_out);
	bool LStat(const char* path, StatRecord* st);
	bool LChmod(const char* path, uint32_t mode);
	char* Resolve(const char* path, bool strict = true);
	bool Exists(const char* path);
	bool IsDir(const char* path);
	bool IsFile(const char* path);
	bool IsSymlink(const char* path);
	bool Touch(const char* path, uint32_t mode = 0666, bool exist_ok = true);
	bool Mkdir(const char* path, uint32_t mode = 0777, bool parents = false,
	           bool exist_ok = false);
	bool Symlink(const char* target, const char* path);
	bool Unlink(const char* path);
	bool Rmdir(const char* path);
	bool Rename(const char* path, const char* dest);
	bool Replace(const char* path, const char* dest);

public:
	bool NotFound(const char* path);
	bool AlreadyExists(const char* path);
	bool NotADirectory(const char* path);
	bool IsADirectory(const char* path);
	bool NotASymlink(const char* path);
	bool PermissionDenied(const char* path);
	bool NotSupported(const char* path);
	bool Corrupt(const char* path);
	const char* ErrorPath() const { return error_path; }
	uint64_t DeviceId() const { return (uint64_t) (uintptr_t) this; }

protected:
	// Looks up a path whose every component but the last is known to be a
	// directory, without following a final symbolic link.
	virtual bool Lookup(const char* resolved_path, StatRecord* st) = 0;
	char* ResolvePath(const char* path, bool follow_final, bool strict);
	// Resolves all but the final component, which must name an entry in an
	// existing directory.
	char* ResolveParent(const char* path);

private:
	bool Fail(int errnum, const char* path);

private:
	char* error_path;

};

static inline bool IsAbsent(int errnum)
{
	return errnum == ENOENT || errnum == ENOTDIR;
}

} // namespace Pathlab

#endif
