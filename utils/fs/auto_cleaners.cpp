// Copyright 2015 Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
// * Redistributions of source code must retain the above copyright
//   notice, this list of conditions and the following disclaimer.
// * Redistributions in binary form must reproduce the above copyright
//   notice, this list of conditions and the following disclaimer in the
//   documentation and/or other materials provided with the distribution.
// * Neither the name of Google Inc. nor the names of its contributors
//   may be used to endorse or promote products derived from this software
//   without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "utils/fs/auto_cleaners.hpp"

#include "utils/format/macros.hpp"
#include "utils/fs/exceptions.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"
#include "utils/noncopyable.hpp"

namespace fs = utils::fs;


/// Shared implementation of the auto_rmdir.
struct fs::auto_rmdir::impl : utils::noncopyable {
    /// The path to the directory being managed.
    fs::path _directory;

    /// Whether removal has already been attempted or not.
    bool _attempted;

    /// Constructor.
    ///
    /// \param directory_ The directory to grab the ownership of.
    impl(const path& directory_) :
        _directory(directory_),
        _attempted(false)
    {
    }

    /// Destructor.
    ~impl(void)
    {
        try {
            this->remove();
        } catch (const fs::error& e) {
            LD(F("Did not remove directory '%s': %s") % _directory %
               e.what());
        }
    }

    /// Removes the managed directory if it is empty.
    ///
    /// \throw fs::error If the directory cannot be removed.
    void
    remove(void)
    {
        if (!_attempted) {
            // Mark this as attempted first so that, in case of failure, we
            // don't retry from the destructor.
            _attempted = true;

            fs::rmdir(_directory);
        }
    }
};


/// Constructs a new auto_rmdir and grabs ownership of a directory.
///
/// \param directory_ The directory to grab the ownership of.
fs::auto_rmdir::auto_rmdir(const path& directory_) :
    _pimpl(new impl(directory_))
{
}


/// Removes the managed directory if it is empty.
///
/// Errors are logged at the debug level: a non-empty or missing directory is
/// an expected outcome.
fs::auto_rmdir::~auto_rmdir(void)
{
}


/// Gets the directory managed by this auto_rmdir.
///
/// \return The path to the managed directory.
const fs::path&
fs::auto_rmdir::directory(void) const
{
    return _pimpl->_directory;
}


/// Removes the managed directory if it is empty.
///
/// This operation is idempotent: only the first call attempts the removal.
///
/// \throw fs::error If there is a problem removing the directory.
void
fs::auto_rmdir::remove(void)
{
    _pimpl->remove();
}


/// Shared implementation of the auto_file.
struct fs::auto_file::impl : utils::noncopyable {
    /// The path to the file being managed.
    fs::path _file;

    /// Whether the file has already been removed or not.
    bool _removed;

    /// Constructor.
    ///
    /// \param file_ The file to grab the ownership of.
    impl(const path& file_) :
        _file(file_),
        _removed(false)
    {
    }

    /// Destructor.
    ~impl(void)
    {
        try {
            this->remove();
        } catch (const fs::error& e) {
            LW(F("Failed to auto-cleanup file '%s': %s") % _file %
               e.what());
        }
    }

    /// Deletes the managed file.
    ///
    /// \throw fs::error If there is a problem removing the file.
    void
    remove(void)
    {
        if (!_removed) {
            _removed = true;
            fs::unlink(_file);
        }
    }
};


/// Constructs a new auto_file and grabs ownership of a file.
///
/// \param file_ The file to grab the ownership of.
fs::auto_file::auto_file(const path& file_) :
    _pimpl(new impl(file_))
{
}


/// Deletes the managed file.
fs::auto_file::~auto_file(void)
{
}


/// \return The path to the managed file.
const fs::path&
fs::auto_file::file(void) const
{
    return _pimpl->_file;
}


/// Deletes the managed file.
///
/// This operation is idempotent.
///
/// \throw fs::error If there is a problem removing the file.
void
fs::auto_file::remove(void)
{
    _pimpl->remove();
}
