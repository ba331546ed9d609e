#ifndef UTILS_OWNED_PTR_HPP_
#define UTILS_OWNED_PTR_HPP_

#include <cstddef>

namespace utils
{

// C++98 向けのスコープ付き単一所有ポインタ。
// - スコープを抜けると delete する
// - コピー不可。所有権の受け渡しは release() / reset() で明示的に行う
//   （create() 系のファクトリが返す生ポインタを受け取るために使う）
template <typename T>
class OwnedPtr
{
   public:
    explicit OwnedPtr(T* ptr = NULL) : ptr_(ptr) {}
    ~OwnedPtr() { delete ptr_; }

    T* get() const { return ptr_; }

    // 所有権を手放す。以降 delete しない。
    T* release()
    {
        T* tmp = ptr_;
        ptr_ = NULL;
        return tmp;
    }

    void reset(T* ptr = NULL)
    {
        if (ptr_ == ptr)
            return;
        delete ptr_;
        ptr_ = ptr;
    }

    T& operator*() const { return *ptr_; }
    T* operator->() const { return ptr_; }

   private:
    OwnedPtr(const OwnedPtr& rhs);
    OwnedPtr& operator=(const OwnedPtr& rhs);

    T* ptr_;
};

}  // namespace utils

#endif
