namespace arcget
{
  template <typename V, typename C>
  std::optional<V> basic_metadata_cache<V, C>::
  find (const std::string& k, time_point now)
  {
    auto i (entries_.find (k));

    if (i == entries_.end ())
      return std::nullopt;

    if (stale (i->second, now))
    {
      order_.erase (i->second.position);
      entries_.erase (i);
      return std::nullopt;
    }

    // Move to front.
    //
    order_.splice (order_.begin (), order_, i->second.position);
    return i->second.value;
  }

  template <typename V, typename C>
  void basic_metadata_cache<V, C>::
  insert (const std::string& k, value_type v, time_point now)
  {
    auto i (entries_.find (k));

    if (i != entries_.end ())
    {
      i->second.value = std::move (v);
      i->second.inserted = now;
      order_.splice (order_.begin (), order_, i->second.position);
      return;
    }

    order_.push_front (k);
    entries_.emplace (k, entry {std::move (v), now, order_.begin ()});

    while (entries_.size () > capacity_)
    {
      entries_.erase (order_.back ());
      order_.pop_back ();
    }
  }

  template <typename V, typename C>
  bool basic_metadata_cache<V, C>::
  erase (const std::string& k)
  {
    auto i (entries_.find (k));

    if (i == entries_.end ())
      return false;

    order_.erase (i->second.position);
    entries_.erase (i);
    return true;
  }

  template <typename V, typename C>
  std::size_t basic_metadata_cache<V, C>::
  purge (time_point now)
  {
    std::size_t n (0);

    for (auto i (entries_.begin ()); i != entries_.end (); )
    {
      if (stale (i->second, now))
      {
        order_.erase (i->second.position);
        i = entries_.erase (i);
        ++n;
      }
      else
        ++i;
    }

    return n;
  }
}
