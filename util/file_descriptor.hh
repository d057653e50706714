#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

// A reference-counted handle to a file descriptor
class FileDescriptor
{
  // FDWrapper: A handle on a kernel file descriptor.
  // FileDescriptor objects contain a std::shared_ptr to a FDWrapper.
  class FDWrapper
  {
  public:
    int fd_;                    // The file descriptor number returned by the kernel
    bool eof_ = false;          // Flag indicating whether FDWrapper::fd_ is at EOF
    bool closed_ = false;       // Flag indicating whether FDWrapper::fd_ has been closed
    bool non_blocking_ = false; // Flag indicating whether FDWrapper::fd_ is non-blocking

    // Construct from a file descriptor number returned by the kernel
    explicit FDWrapper( int fd );
    // Closes the file descriptor upon destruction
    ~FDWrapper();
    // Calls [close(2)](\ref man2::close) on FDWrapper::fd_
    void close();

    template<typename T>
    T CheckSystemCall( std::string_view s_attempt, T return_value ) const;

    // An FDWrapper cannot be copied or moved
    FDWrapper( const FDWrapper& other ) = delete;
    FDWrapper& operator=( const FDWrapper& other ) = delete;
    FDWrapper( FDWrapper&& other ) = delete;
    FDWrapper& operator=( FDWrapper&& other ) = delete;
  };

  // A reference-counted handle to a shared FDWrapper
  std::shared_ptr<FDWrapper> internal_fd_;

protected:
  // size of buffer to allocate for read()
  static constexpr size_t kReadBufferSize = 16384;

  template<typename T>
  T CheckSystemCall( std::string_view s_attempt, T return_value ) const;

public:
  // Construct from a file descriptor number returned by the kernel
  explicit FileDescriptor( int fd );

  // Free the std::shared_ptr; the FDWrapper destructor calls close() when the refcount goes to zero.
  ~FileDescriptor() = default;

  // Read into `buffer`, replacing its contents with whatever one read(2) returned
  void read( std::string& buffer );

  // Attempt to write a buffer; returns the number of bytes written
  size_t write( std::string_view buffer );

  // Write the whole buffer, blocking until every byte is accepted
  void write_all( std::string_view buffer );

  // Close the underlying file descriptor
  void close() { internal_fd_->close(); }

  // FDWrapper accessors
  int fd_num() const { return internal_fd_->fd_; }      // underlying descriptor number
  bool eof() const { return internal_fd_->eof_; }       // EOF flag state
  bool closed() const { return internal_fd_->closed_; } // closed flag state

  // Copy/move constructor/assignment operators
  // FileDescriptor can be moved, but cannot be copied
  FileDescriptor( const FileDescriptor& other ) = delete;            // copy construction is forbidden
  FileDescriptor& operator=( const FileDescriptor& other ) = delete; // copy assignment is forbidden
  FileDescriptor( FileDescriptor&& other ) = default;                // move construction is allowed
  FileDescriptor& operator=( FileDescriptor&& other ) = default;      // move assignment is allowed
};
