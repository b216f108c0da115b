// -*- mode: c++ -*-

#ifndef FILE_BACKED_ARRAY_H
#define FILE_BACKED_ARRAY_H

#include <cassert>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iterator>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/mman.h>
#include <unistd.h>

#include "util.h"

// A roughly vector-like class which is to start with stored in
// normal memory. But if the total size of the array grows to
// more than kFlushThreshold elements, starts instead storing
// the bulk of the data on disk (with access to the data
// provided with mmap).
//
// The array is append-only, and alternates between two modes.
// While thawed it can only be written to; while frozen it can only
// be read from. Appended data is grouped into runs, which is how
// the search keeps the records of each generation apart.
template<class T,
         // 100M
         size_t kFlushThreshold = 100000000 / sizeof(T)>
class file_backed_mmap_array {
public:
    // A range of elements: [first, second).
    using Run = std::pair<const T*, const T*>;

    // Marks everything appended during the lifetime of this object
    // as one run.
    class WriteRun {
    public:
        explicit WriteRun(file_backed_mmap_array* array) : array_(array) {
            array_->start_run();
        }

        ~WriteRun() {
            array_->end_run();
        }

    private:
        WriteRun(const WriteRun& other) = delete;
        WriteRun& operator=(const WriteRun& other) = delete;

        file_backed_mmap_array* array_;
    };

    file_backed_mmap_array() {
    }

    file_backed_mmap_array(const file_backed_mmap_array& other) = delete;
    file_backed_mmap_array& operator=(const file_backed_mmap_array& other) = delete;

    ~file_backed_mmap_array() {
        maybe_close();
    }

    // Returns the number of elements in the array.
    size_t size() const { return size_; }

    // Copies "data" into the last element of the array.
    void push_back(const T& data) {
        assert(!frozen_);
        buffer_.push_back(data);
        size_++;
        maybe_flush();
    }

    // Inserts a range of objects from begin to end at the end
    // of the array.
    template<class It>
    void insert_back(const It begin, const It end) {
        assert(!frozen_);
        buffer_.insert(buffer_.end(), begin, end);
        size_ += std::distance(begin, end);
        maybe_flush();
    }

    // Prepares the array for reading. No mutating operations
    // may be executed while the array is frozen.
    void freeze() {
        assert(!frozen_);
        if (fd_ >= 0 && size_ > 0) {
            flush();
            size_t len = sizeof(T) * size_;
            void* map = mmap(NULL, len, PROT_READ, MAP_SHARED, fd_, 0);
            if (map == MAP_FAILED) {
                die_errno("mmap");
            }
            array_ = (T*) map;
        } else {
            array_ = buffer_.data();
        }
        frozen_ = true;
    }

    // Prepares the array for writing. No operations that read
    // specific elements may be executed while the array is thawed;
    // only pure writes.
    void thaw() {
        assert(frozen_);
        frozen_ = false;
        maybe_unmap();
    }

    // Returns a range for the i'th run that was recorded for the
    // array.
    Run run(int i) const {
        assert(frozen_);
        assert(i < run_count());
        return std::make_pair(array_ + run_starts_[i],
                              array_ + run_ends_[i]);
    }

    // Returns the number of recorded runs.
    int run_count() const {
        return run_ends_.size();
    }

private:
    // Marks the start of a new run of elements, after the last
    // element currently in the array.
    void start_run() {
        assert(!frozen_);
        assert(run_starts_.size() == run_ends_.size());
        run_starts_.push_back(size_);
    }

    // Marks the current run as ending after the last element
    // currently in the array.
    void end_run() {
        run_ends_.push_back(size_);
    }

    // Writes whatever data we have buffered in memory to the
    // backing file.
    void flush() {
        const char* data = (const char*) buffer_.data();
        size_t bytes = sizeof(T) * buffer_.size();
        while (bytes) {
            ssize_t written = write(fd_, data, bytes);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                die_errno("write");
            }
            data += written;
            bytes -= written;
        }
        buffer_.clear();
    }

    // If the array has a backing file and it's mapped, unmaps it.
    void maybe_unmap() {
        if (fd_ >= 0 && array_) {
            munmap((void*) array_, size_ * sizeof(T));
        }
        array_ = NULL;
    }

    // If the array has a backing file, unmaps and closes the file.
    void maybe_close() {
        if (fd_ >= 0) {
            maybe_unmap();
            close(fd_);
            fd_ = -1;
        }
    }

    // Opens a backing file for this array in the current working
    // directory. The file is unlinked right away, so it disappears
    // once the array is destroyed (or the process dies).
    void open() {
        assert(fd_ == -1);
        char fname[] = "file-backed-tmp-XXXXXX";
        fd_ = mkstemp(fname);
        if (fd_ < 0) {
            die_errno("mkstemp");
        }
        unlink(fname);
    }

    // Flushes the array to disk, if the array is large enough.
    void maybe_flush() {
        if (buffer_.size() >= kFlushThreshold) {
            if (fd_ == -1) {
                open();
            }
            flush();
        }
    }

    std::vector<size_t> run_starts_;
    std::vector<size_t> run_ends_;
    // Elements that have been written to end of the array, but
    // not flushed to disk.
    std::vector<T> buffer_;
    bool frozen_ = false;
    // The number of elements in the array.
    size_t size_ = 0;
    // The file descriptor of the backing file; -1 if the array
    // does not yet have a backing file.
    int fd_ = -1;
    // A pointer to the start of the backing store (whether a mmaped
    // view of the backing file, or the in-memory buffer).
    T* array_ = NULL;
};

#endif // FILE_BACKED_ARRAY_H
