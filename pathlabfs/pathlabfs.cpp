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
 * pathlabfs.cpp
 * Mounts ISO 9660, ZIP and TAR files as filesystems.
 */

#include <sys/stat.h>
#include <sys/types.h>

#include <err.h>
#include <errno.h>
#include <getopt.h>
#include <inttypes.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>

#include <pathlab/accessor.h>
#include <pathlab/archive.h>
#include <pathlab/isoaccessor.h>
#include <pathlab/stat.h>

#include "fuse.h"
#include "pathlabfs.h"

using namespace Pathlab;

enum ArchiveType
{
	ARCHIVE_TYPE_NONE,
	ARCHIVE_TYPE_ISO,
	ARCHIVE_TYPE_ZIP,
	ARCHIVE_TYPE_TAR,
};

mode_t HostModeFromRecord(const StatRecord* record)
{
	mode_t hostmode = record->permissions & 07777;
	switch ( record->type )
	{
	case FILE_TYPE_DIR: hostmode |= S_IFDIR; break;
	case FILE_TYPE_SYMLINK: hostmode |= S_IFLNK; break;
	case FILE_TYPE_SOCKET: hostmode |= S_IFSOCK; break;
	case FILE_TYPE_FIFO: hostmode |= S_IFIFO; break;
	case FILE_TYPE_CHAR_DEVICE: hostmode |= S_IFCHR; break;
	case FILE_TYPE_BLOCK_DEVICE: hostmode |= S_IFBLK; break;
	default: hostmode |= S_IFREG; break;
	}
	return hostmode;
}

void StatRecordToHost(const StatRecord* record, struct stat* st)
{
	memset(st, 0, sizeof(*st));
	st->st_ino = record->file_id;
	st->st_mode = HostModeFromRecord(record);
	st->st_nlink = record->hard_link_count;
	st->st_uid = record->user_id;
	st->st_gid = record->group_id;
	st->st_size = record->size;
	st->st_atim = record->access_time;
	st->st_ctim = record->status_time;
	st->st_mtim = record->modify_time;
	st->st_blksize = 4096;
	st->st_blocks = (st->st_size + 511) / 512;
}

static bool HasSuffix(const char* string, const char* suffix)
{
	size_t string_length = strlen(string);
	size_t suffix_length = strlen(suffix);
	return suffix_length <= string_length &&
	       !strcasecmp(string + string_length - suffix_length, suffix);
}

static int ParseArchiveType(const char* name)
{
	if ( !strcmp(name, "iso") )
		return ARCHIVE_TYPE_ISO;
	if ( !strcmp(name, "zip") )
		return ARCHIVE_TYPE_ZIP;
	if ( !strcmp(name, "tar") )
		return ARCHIVE_TYPE_TAR;
	return ARCHIVE_TYPE_NONE;
}

static int InferArchiveType(const char* path)
{
	if ( HasSuffix(path, ".iso") )
		return ARCHIVE_TYPE_ISO;
	if ( HasSuffix(path, ".zip") )
		return ARCHIVE_TYPE_ZIP;
	const char* tar_suffixes[] =
	{
		".tar", ".tar.gz", ".tgz", ".tar.bz2", ".tbz2", ".tar.xz", ".txz",
		".tar.zst", NULL,
	};
	for ( size_t i = 0; tar_suffixes[i]; i++ )
		if ( HasSuffix(path, tar_suffixes[i]) )
			return ARCHIVE_TYPE_TAR;
	return ARCHIVE_TYPE_NONE;
}

int main(int argc, char* argv[])
{
	const char* fuse_options = NULL;
	const char* pretend_mount_path = NULL;
	bool foreground = false;
	bool verbose = false;
	bool writable = false;
	bool read_only_requested = false;
	int type = ARCHIVE_TYPE_NONE;
	IsoOptions iso_options;
	enum
	{
		OPT_FUSE_OPTIONS = 257,
	};
	const struct option longopts[] =
	{
		{"fuse-options", required_argument, NULL, OPT_FUSE_OPTIONS},
		{"background", no_argument, NULL, 'b'},
		{"foreground", no_argument, NULL, 'f'},
		{"pretend-mount-path", required_argument, NULL, 'p'},
		{"type", required_argument, NULL, 't'},
		{"verbose", no_argument, NULL, 'v'},
		{0, 0, 0, 0}
	};
	const char* opts = "bfo:p:t:v";
	int opt;
	while ( (opt = getopt_long(argc, argv, opts, longopts, NULL)) != -1 )
	{
		switch ( opt )
		{
		case OPT_FUSE_OPTIONS: fuse_options = optarg; break;
		case 'b': foreground = false; break;
		case 'f': foreground = true; break;
		case 'o':
		{
			char* arg = optarg;
			char* save;
			char* tok;
			while ( (tok = strtok_r(arg, ",", &save)) )
			{
				if ( !strcmp(tok, "ro") )
					writable = false, read_only_requested = true;
				else if ( !strcmp(tok, "rw") )
					writable = true;
				else if ( !strncmp(tok, "cache=", strlen("cache=")) )
				{
					char* end;
					errno = 0;
					uintmax_t val = strtoumax(tok + strlen("cache="), &end, 10);
					if ( errno || end == tok + strlen("cache=") || *end ||
					     SIZE_MAX < val )
						errx(1, "invalid cache size: %s", tok);
					iso_options.cache_size = (size_t) val;
				}
				else if ( !strcmp(tok, "norock") )
					iso_options.no_rock = true;
				else if ( !strcmp(tok, "nosusp") )
					iso_options.no_susp = true;
				else if ( !strncmp(tok, "type=", strlen("type=")) )
				{
					type = ParseArchiveType(tok + strlen("type="));
					if ( type == ARCHIVE_TYPE_NONE )
						errx(1, "unknown archive type: %s", tok);
				}
				else
					warnx("warning: unknown mount option: %s", tok);
				arg = NULL;
			}
			break;
		}
		case 'p': pretend_mount_path = optarg; break;
		case 't':
			if ( (type = ParseArchiveType(optarg)) == ARCHIVE_TYPE_NONE )
				errx(1, "unknown archive type: %s", optarg);
			break;
		case 'v': verbose = true; break;
		default: return 1;
		}
	}

	if ( argc - optind < 1 )
		errx(1, "expected archive");

	const char* archive_path = argv[optind + 0];
	const char* mount_path = 2 <= argc - optind ? argv[optind + 1] : NULL;

	if ( !pretend_mount_path )
		pretend_mount_path = mount_path;

	if ( type == ARCHIVE_TYPE_NONE &&
	     (type = InferArchiveType(archive_path)) == ARCHIVE_TYPE_NONE )
		errx(1, "%s: unable to infer the archive type, use -t", archive_path);

	Accessor* accessor;
	switch ( type )
	{
	case ARCHIVE_TYPE_ISO:
		if ( writable )
			errx(1, "-o rw: ISO 9660 images are not writable");
		accessor = Iso9660Accessor::Mount(archive_path, &iso_options);
		break;
	case ARCHIVE_TYPE_ZIP:
		accessor = ZipAccessor::Mount(archive_path);
		break;
	default:
		accessor = TarAccessor::Mount(archive_path);
		break;
	}
	if ( !accessor )
	{
		if ( errno == EBADMSG )
			errx(1, "Not a valid archive: %s", archive_path);
		err(1, "%s", archive_path);
	}
	// Archives are writable unless asked otherwise.
	if ( type != ARCHIVE_TYPE_ISO && !read_only_requested )
		writable = true;

	if ( verbose )
	{
		size_t count;
		char** names = accessor->ListDir("/", &count);
		if ( !names )
			err(1, "%s: listing the root directory", archive_path);
		warnx("%s: %zu entries in the root directory%s", archive_path, count,
		      writable ? "" : ", read-only");
		FreeNames(names, count);
	}

	if ( !mount_path )
		return delete accessor, 0;

	return pathlabfs_fuse_main(argv[0], mount_path, pretend_mount_path,
	                           fuse_options, foreground, writable, verbose,
	                           accessor);
}
