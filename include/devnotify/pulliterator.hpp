#ifndef DEVNOTIFY_PULLITERATOR_HPP
#define DEVNOTIFY_PULLITERATOR_HPP

#include <boost/iterator/iterator_facade.hpp>
#include <boost/optional.hpp>

namespace devnotify {

// Adapts anything with a `boost::optional<Value> next()` member into a single-pass iterator, so
// DeviceIterator and PathIterator work in range-based for loops.
template <class Source, class Value>
class PullIterator
    : public boost::iterator_facade<
        PullIterator<Source, Value>, Value, boost::single_pass_traversal_tag> {
public:
    PullIterator () = default;

    explicit PullIterator (Source& source)
        : mSource(&source)
    {
        increment();
    }

private:
    friend class boost::iterator_core_access;

    void increment () {
        if (mSource) {
            mValue = mSource->next();
            if (!mValue) {
                mSource = nullptr;
            }
        }
    }

    bool equal (const PullIterator& other) const {
        // Only equal if they're both end iterators.
        return !mSource && !other.mSource;
    }

    Value& dereference () const {
        return const_cast<Value&>(*mValue);
    }

    Source* mSource = nullptr;
    boost::optional<Value> mValue;
};

} // namespace devnotify

#endif
