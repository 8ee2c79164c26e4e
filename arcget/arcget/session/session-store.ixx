namespace arcget
{
  template <typename T>
  inline const fs::path& basic_session_store<T>::
  path () const noexcept
  {
    return path_;
  }
}
