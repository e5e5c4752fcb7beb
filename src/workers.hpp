#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace qrsx {

// Runs fn(i) for i in [0,count) on at most `workers` threads. Items are
// handed out in order; the first exception thrown is rethrown after all
// threads have joined.
template <typename Fn>
void parallel_for(size_t count,unsigned workers,Fn fn){
  if(count==0) return;
  size_t n=std::min<size_t>(workers? workers : 1,count);
  if(n==1){ for(size_t i=0;i<count;++i) fn(i); return; }

  std::atomic<size_t> next(0);
  std::exception_ptr err;
  std::mutex err_mu;
  auto run=[&](){
    for(;;){
      size_t i=next.fetch_add(1);
      if(i>=count) return;
      try{ fn(i); }
      catch(...){
        std::lock_guard<std::mutex> lk(err_mu);
        if(!err) err=std::current_exception();
        next.store(count);
        return;
      }
    }
  };
  std::vector<std::thread> pool;
  pool.reserve(n);
  try{
    for(size_t t=0;t<n;++t) pool.emplace_back(run);
  }catch(...){
    // spawning failed: stop handing out items, join what started
    next.store(count);
    for(auto& th: pool) th.join();
    throw;
  }
  for(auto& th: pool) th.join();
  if(err) std::rethrow_exception(err);
}

} // namespace qrsx
