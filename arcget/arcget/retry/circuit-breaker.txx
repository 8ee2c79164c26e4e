namespace arcget
{
  template <typename C>
  void basic_circuit_breaker<C>::
  transition (breaker_state s, time_point now)
  {
    state_ = s;
    last_transition_ = now;
    trial_ = false;
  }

  template <typename C>
  void basic_circuit_breaker<C>::
  expire (time_point now)
  {
    if (state_ == breaker_state::open &&
        now - last_transition_ >= options_.open_timeout)
      transition (breaker_state::half_open, now);
  }

  template <typename C>
  bool basic_circuit_breaker<C>::
  allow (time_point now)
  {
    expire (now);

    switch (state_)
    {
    case breaker_state::closed:
      return true;
    case breaker_state::open:
      return false;
    case breaker_state::half_open:
      {
        if (trial_)
          return false;

        trial_ = true;
        return true;
      }
    }

    return false;
  }

  template <typename C>
  void basic_circuit_breaker<C>::
  record_success (time_point now)
  {
    expire (now);

    switch (state_)
    {
    case breaker_state::closed:
      failures_ = 0;
      break;
    case breaker_state::half_open:
      failures_ = 0;
      transition (breaker_state::closed, now);
      break;
    case breaker_state::open:
      // A request that was let through before we opened finished late. That
      // is not a trial so it doesn't get to close us.
      //
      break;
    }
  }

  template <typename C>
  void basic_circuit_breaker<C>::
  record_failure (time_point now)
  {
    expire (now);

    switch (state_)
    {
    case breaker_state::closed:
      if (++failures_ >= options_.failure_threshold)
        transition (breaker_state::open, now);
      break;
    case breaker_state::half_open:
      ++failures_;
      transition (breaker_state::open, now);
      break;
    case breaker_state::open:
      ++failures_;
      break;
    }
  }

  template <typename C>
  void basic_circuit_breaker<C>::
  reset (time_point now)
  {
    if (state_ == breaker_state::open)
      transition (breaker_state::half_open, now);

    if (state_ == breaker_state::half_open)
      transition (breaker_state::closed, now);

    failures_ = 0;
    trial_ = false;
  }

  template <typename C>
  breaker_state basic_circuit_breaker<C>::
  state (time_point now)
  {
    expire (now);
    return state_;
  }

  template <typename C>
  typename basic_circuit_breaker<C>::duration basic_circuit_breaker<C>::
  remaining (time_point now) const
  {
    if (state_ != breaker_state::open)
      return duration::zero ();

    duration e (now - last_transition_);
    duration t (std::chrono::duration_cast<duration> (options_.open_timeout));

    return e >= t ? duration::zero () : t - e;
  }
}
