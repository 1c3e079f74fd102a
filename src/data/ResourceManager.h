// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#ifndef CHUNKXFER_DATA_RESOURCEMANAGER_H_
#define CHUNKXFER_DATA_RESOURCEMANAGER_H_

#include <stddef.h>  // for size_t

#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"

namespace CX {

namespace Data {

typedef boost::shared_ptr<std::vector<char> > Resource;

/**
 * Pool of chunk buffers with Acquire/Release semantics.
 *
 * Acquire blocks until a buffer is available, Release unblocks one
 * waiting Acquire. Holding one buffer per in-flight chunk bounds the
 * number of chunks in flight to the pool size.
 * ShutdownAndWait waits for every buffer to come back; Acquire must not
 * be called after it.
 */
class ResourceManager : private boost::noncopyable {
 public:
  // @param  : number of buffers, size in bytes of each buffer
  ResourceManager(size_t resourceCount, size_t resourceSize);
  ~ResourceManager() {}

 public:
  // Hint only, another thread may grab the resources right after
  bool ResourcesAvailable();

  bool IsShutdown() const;

  size_t GetResourceCount() const { return m_resourceCount; }

  // Returns a resource with exclusive ownership, an empty one once the
  // manager is shut down.
  Resource Acquire();

  // Release a resource back to the pool.
  void Release(const Resource &resource);

  // Waits for all acquired resources to be released
  //
  // @param  : void
  // @return : the pooled resources
  std::vector<Resource> ShutdownAndWait();

 private:
  void SetShutdown(bool shutdown);
  bool AcquirePredicate() const;
  bool AllReleasedPredicate() const;

 private:
  std::vector<Resource> m_resources;
  size_t m_resourceCount;
  boost::mutex m_queueLock;
  boost::condition_variable m_semaphore;
  bool m_shutdown;
  mutable boost::mutex m_shutdownLock;

  friend class ResourceManagerTest;
};

}  // namespace Data
}  // namespace CX

#endif  // CHUNKXFER_DATA_RESOURCEMANAGER_H_
